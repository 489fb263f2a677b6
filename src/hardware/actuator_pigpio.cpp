#include "hardware/actuator.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <pigpio.h>

namespace cluster_dial::hardware {
namespace {

void check(const int rc, const char* call, const unsigned int pin) {
  if (rc < 0) {
    throw ActuatorError(std::string(call) + " failed on pin " + std::to_string(pin) + " with pigpio error " +
                        std::to_string(rc));
  }
}

// Owns the process-wide pigpio library state.
class PigpioSession {
 public:
  PigpioSession() {
    // SIGINT/SIGTERM belong to the process; pigpio must not terminate it behind our back.
    if (gpioCfgSetInternals(gpioCfgGetInternals() | PI_CFG_NOSIGHANDLER) < 0) {
      throw std::runtime_error("pigpio: unable to disable the library signal handler");
    }

    const int version = gpioInitialise();
    if (version < 0) {
      throw std::runtime_error("pigpio initialisation failed (error " + std::to_string(version) +
                               "); run as root and make sure pigpiod is not holding the GPIOs");
    }
    std::cerr << "[actuator] pigpio version " << version << " initialised\n";
  }

  ~PigpioSession() { gpioTerminate(); }

  PigpioSession(const PigpioSession&) = delete;
  PigpioSession& operator=(const PigpioSession&) = delete;
};

class PigpioActuatorDriver final : public ActuatorDriver {
 public:
  PigpioActuatorDriver(const PinTable& pins, const PointerOptions& pointer) : pins_(pins), pointer_(pointer) {
    for (const unsigned int pin : pins_.all_pins()) {
      check(gpioSetMode(pin, PI_OUTPUT), "gpioSetMode", pin);
      check(gpioWrite(pin, PI_LOW), "gpioWrite", pin);
    }
  }

  bool available() const override { return true; }

  void set_pin(const unsigned int pin, const PinLevel level) override {
    std::cerr << "[actuator] pin " << pin << " -> " << (level == PinLevel::HIGH ? "high" : "low") << '\n';
    check(gpioWrite(pin, level == PinLevel::HIGH ? PI_HIGH : PI_LOW), "gpioWrite", pin);
  }

  void set_pointer_angle(const int angle_deg) override {
    const int angle = core::clamp_angle(angle_deg);
    const unsigned int pulse_us = pulse_width_for_angle(angle, pointer_);
    std::cerr << "[actuator] pointer -> " << angle << " deg (pulse " << pulse_us << " us)\n";

    check(gpioServo(pins_.pointer, pulse_us), "gpioServo", pins_.pointer);
    std::this_thread::sleep_for(pointer_.settle);
    stop_pointer();
  }

  void stop_pointer() override { check(gpioServo(pins_.pointer, 0), "gpioServo", pins_.pointer); }

 private:
  PigpioSession session_{};
  PinTable pins_;
  PointerOptions pointer_;
};

}  // namespace

std::unique_ptr<ActuatorDriver> make_pigpio_driver(const PinTable& pins, const PointerOptions& pointer) {
  return std::make_unique<PigpioActuatorDriver>(pins, pointer);
}

}  // namespace cluster_dial::hardware

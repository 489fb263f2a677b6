#include "hardware/actuator.hpp"

#include <iostream>
#include <memory>
#include <thread>

namespace cluster_dial::hardware {
namespace {

class NoneActuatorDriver final : public ActuatorDriver {
 public:
  NoneActuatorDriver(const PinTable& pins, const PointerOptions& pointer) : pins_(pins), pointer_(pointer) {}

  bool available() const override { return false; }

  void set_pin(const unsigned int pin, const PinLevel level) override {
    std::cerr << "[actuator] (dry-run) pin " << pin << " -> " << (level == PinLevel::HIGH ? "high" : "low") << '\n';
  }

  void set_pointer_angle(const int angle_deg) override {
    const int angle = core::clamp_angle(angle_deg);
    std::cerr << "[actuator] (dry-run) pointer pin " << pins_.pointer << " -> " << angle << " deg (pulse "
              << pulse_width_for_angle(angle, pointer_) << " us)\n";
    std::this_thread::sleep_for(pointer_.settle);
    stop_pointer();
  }

  void stop_pointer() override { std::cerr << "[actuator] (dry-run) pointer pin " << pins_.pointer << " released\n"; }

 private:
  PinTable pins_;
  PointerOptions pointer_;
};

}  // namespace

std::unique_ptr<ActuatorDriver> make_none_driver(const PinTable& pins, const PointerOptions& pointer) {
  return std::make_unique<NoneActuatorDriver>(pins, pointer);
}

}  // namespace cluster_dial::hardware

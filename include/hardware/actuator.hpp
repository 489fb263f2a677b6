#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>

#include "core/math.hpp"
#include "hardware/pins.hpp"

namespace cluster_dial::hardware {

enum class PinLevel : std::uint8_t {
  LOW = 0,
  HIGH = 1,
};

class ActuatorError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ActuatorDriver {
 public:
  virtual bool available() const = 0;

  // Idempotent.
  virtual void set_pin(unsigned int pin, PinLevel level) = 0;

  // Drives the pointer toward angle_deg, blocks for the settle delay, then removes drive.
  virtual void set_pointer_angle(int angle_deg) = 0;

  // Removes drive without repositioning.
  virtual void stop_pointer() = 0;

  virtual ~ActuatorDriver() = default;
};

// 50 Hz servo frame: min_pulse_us at 0 degrees, max_pulse_us at 180 degrees.
inline unsigned int pulse_width_for_angle(const int angle_deg, const PointerOptions& options) noexcept {
  const auto angle = static_cast<unsigned int>(core::clamp_angle(angle_deg));
  const unsigned int span = options.max_pulse_us - options.min_pulse_us;
  return options.min_pulse_us + (angle * span + core::kPointerRangeDeg / 2) / core::kPointerRangeDeg;
}

std::unique_ptr<ActuatorDriver> make_pigpio_driver(const PinTable& pins, const PointerOptions& pointer);
std::unique_ptr<ActuatorDriver> make_none_driver(const PinTable& pins, const PointerOptions& pointer);

}  // namespace cluster_dial::hardware

#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include "hardware/actuator.hpp"

namespace cluster_dial::tests {

struct ActuatorEvent {
  enum class Kind { PIN, POINTER_ANGLE, POINTER_STOP };

  Kind kind;
  unsigned int pin{0};
  hardware::PinLevel level{hardware::PinLevel::LOW};
  int angle{0};
};

// Records every command; can be told to fail pointer moves to exercise error paths.
class RecordingActuatorDriver final : public hardware::ActuatorDriver {
 public:
  bool available() const override { return true; }

  void set_pin(const unsigned int pin, const hardware::PinLevel level) override {
    levels_[pin] = level;
    events_.push_back({ActuatorEvent::Kind::PIN, pin, level, 0});
  }

  void set_pointer_angle(const int angle_deg) override {
    if (fail_pointer_after_ >= 0 && pointer_commands() >= static_cast<std::size_t>(fail_pointer_after_)) {
      throw hardware::ActuatorError("pointer jammed");
    }
    angle_ = angle_deg;
    events_.push_back({ActuatorEvent::Kind::POINTER_ANGLE, 0, hardware::PinLevel::LOW, angle_deg});
  }

  void stop_pointer() override { events_.push_back({ActuatorEvent::Kind::POINTER_STOP, 0, hardware::PinLevel::LOW, 0}); }

  [[nodiscard]] bool is_high(const unsigned int pin) const {
    const auto it = levels_.find(pin);
    return it != levels_.end() && it->second == hardware::PinLevel::HIGH;
  }

  [[nodiscard]] std::size_t pointer_commands() const {
    std::size_t count = 0;
    for (const auto& event : events_) {
      if (event.kind == ActuatorEvent::Kind::POINTER_ANGLE) {
        ++count;
      }
    }
    return count;
  }

  [[nodiscard]] std::vector<int> pointer_angles() const {
    std::vector<int> angles;
    for (const auto& event : events_) {
      if (event.kind == ActuatorEvent::Kind::POINTER_ANGLE) {
        angles.push_back(event.angle);
      }
    }
    return angles;
  }

  [[nodiscard]] std::optional<int> angle() const { return angle_; }
  [[nodiscard]] const std::vector<ActuatorEvent>& events() const { return events_; }
  [[nodiscard]] const std::unordered_map<unsigned int, hardware::PinLevel>& levels() const { return levels_; }

  void clear_events() { events_.clear(); }

  // Pointer commands beyond the first `count` throw ActuatorError. Negative disables.
  void fail_pointer_after(const int count) { fail_pointer_after_ = count; }

 private:
  std::unordered_map<unsigned int, hardware::PinLevel> levels_{};
  std::vector<ActuatorEvent> events_{};
  std::optional<int> angle_{};
  int fail_pointer_after_{-1};
};

}  // namespace cluster_dial::tests

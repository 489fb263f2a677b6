#pragma once

#include "hardware/actuator.hpp"
#include "hardware/pins.hpp"

namespace cluster_dial::hardware {

// Scoped ownership of the actuators: construction drives every pin low and homes the pointer,
// destruction (or an explicit teardown()) homes the pointer, releases it and drives every pin
// low again. Teardown runs at most once.
class ActuatorGuard {
 public:
  ActuatorGuard(ActuatorDriver& driver, const PinTable& pins);
  ~ActuatorGuard();

  ActuatorGuard(const ActuatorGuard&) = delete;
  ActuatorGuard& operator=(const ActuatorGuard&) = delete;

  void teardown();

 private:
  void all_indicators_low();

  ActuatorDriver& driver_;
  PinTable pins_;
  bool torn_down_{false};
};

}  // namespace cluster_dial::hardware

#include "hardware/actuator_guard.hpp"

#include <exception>
#include <iostream>

#include "core/math.hpp"

namespace cluster_dial::hardware {

ActuatorGuard::ActuatorGuard(ActuatorDriver& driver, const PinTable& pins) : driver_(driver), pins_(pins) {
  std::cerr << "[actuator] setting up pins\n";
  all_indicators_low();
  std::cerr << "[actuator] homing pointer to " << core::kPointerRangeDeg << " deg\n";
  driver_.set_pointer_angle(core::kPointerRangeDeg);
}

ActuatorGuard::~ActuatorGuard() {
  if (torn_down_) {
    return;
  }

  try {
    teardown();
  } catch (const std::exception& ex) {
    std::cerr << "[actuator] teardown failed: " << ex.what() << '\n';
  }
}

void ActuatorGuard::teardown() {
  if (torn_down_) {
    return;
  }
  torn_down_ = true;

  std::cerr << "[actuator] tearing down; homing pointer to " << core::kPointerRangeDeg << " deg\n";

  // Indicators go dark even when the pointer refuses to move.
  std::exception_ptr pointer_failure;
  try {
    driver_.set_pointer_angle(core::kPointerRangeDeg);
  } catch (const ActuatorError&) {
    pointer_failure = std::current_exception();
  }

  // Drive is released even when homing failed.
  try {
    driver_.stop_pointer();
  } catch (const ActuatorError&) {
    if (!pointer_failure) {
      pointer_failure = std::current_exception();
    }
  }

  all_indicators_low();

  if (pointer_failure) {
    std::rethrow_exception(pointer_failure);
  }
}

void ActuatorGuard::all_indicators_low() {
  for (const unsigned int pin : pins_.indicator_pins()) {
    driver_.set_pin(pin, PinLevel::LOW);
  }
  driver_.set_pin(pins_.alarm, PinLevel::LOW);
}

}  // namespace cluster_dial::hardware

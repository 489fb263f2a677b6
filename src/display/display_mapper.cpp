#include "display/display_mapper.hpp"

#include <iostream>

#include "core/math.hpp"

namespace cluster_dial::display {

DisplayMapper::DisplayMapper(hardware::ActuatorDriver& driver, const hardware::PinTable& pins)
    : driver_(driver), pins_(pins) {}

void DisplayMapper::display(const model::metric& metric) {
  std::cerr << "[display] showing " << metric.name << " at " << metric.percent << "%\n";
  light_indicator(metric.led);
  critical_light(metric.percent);
  move_pointer_to_percent(metric.percent);
}

void DisplayMapper::light_indicator(const model::indicator led) {
  const unsigned int selected = pins_.indicator_pin(led);
  std::cerr << "[display] lighting indicator on pin " << selected << '\n';

  for (const unsigned int pin : pins_.indicator_pins()) {
    if (pin != selected) {
      driver_.set_pin(pin, hardware::PinLevel::LOW);
    }
  }
  driver_.set_pin(selected, hardware::PinLevel::HIGH);
}

void DisplayMapper::critical_light(const int percent) {
  if (core::is_critical_percent(percent)) {
    std::cerr << "[display] metric at critical percent " << percent << '\n';
    driver_.set_pin(pins_.alarm, hardware::PinLevel::HIGH);
    return;
  }

  driver_.set_pin(pins_.alarm, hardware::PinLevel::LOW);
}

void DisplayMapper::move_pointer_to_percent(const int percent) {
  const int angle = core::pointer_angle_for_percent(percent);
  std::cerr << "[display] pointer target " << angle << " deg\n";
  driver_.set_pointer_angle(angle);
}

}  // namespace cluster_dial::display

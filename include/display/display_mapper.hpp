#pragma once

#include "hardware/actuator.hpp"
#include "hardware/pins.hpp"
#include "model/cluster_snapshot.hpp"

namespace cluster_dial::display {

class DisplayMapper {
 public:
  DisplayMapper(hardware::ActuatorDriver& driver, const hardware::PinTable& pins);

  // Lights the metric's indicator (and only that one), sets the critical alarm from its percent
  // and sweeps the pointer to the matching angle. Driver errors propagate.
  void display(const model::metric& metric);

 private:
  void light_indicator(model::indicator led);
  void critical_light(int percent);
  void move_pointer_to_percent(int percent);

  hardware::ActuatorDriver& driver_;
  hardware::PinTable pins_;
};

}  // namespace cluster_dial::display

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>

#include "core/config.hpp"
#include "display/display_mapper.hpp"
#include "hardware/actuator.hpp"
#include "hardware/pins.hpp"
#include "metrics/source.hpp"
#include "model/cluster_snapshot.hpp"

namespace cluster_dial::core {

struct DashboardStats {
  std::size_t cycles{0};
  std::size_t successful_fetches{0};
  std::size_t failed_fetches{0};
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;
using StopRequested = std::function<bool()>;

void sleep_for_blocking(std::chrono::milliseconds duration);

// fetch -> select -> display -> sleep. The actuators are acquired for the duration of run() and
// always returned to their idle state on the way out.
class Dashboard {
 public:
  Dashboard(LoopConfig config, metrics::MetricsSource& source, hardware::ActuatorDriver& driver,
            const hardware::PinTable& pins, Sleeper sleeper = sleep_for_blocking);

  // max_cycles == 0 runs until stop_requested() returns true.
  DashboardStats run(const StopRequested& stop_requested, std::size_t max_cycles = 0);

  // One fetch and the matching display update. Returns false when the fetch failed.
  bool run_cycle(DashboardStats& stats);

  [[nodiscard]] model::loop_state state() const noexcept { return state_; }

 private:
  void run_debug_cycle(DashboardStats& stats, const StopRequested& stop_requested);
  void enter_error_display(const model::fetch_error& error);
  void set_all_indicators(hardware::PinLevel level);
  void transition(model::loop_state next);

  // Waits in slices of at most one second so a stop request is honoured promptly.
  void wait(std::chrono::milliseconds duration, const StopRequested& stop_requested);

  LoopConfig config_;
  metrics::MetricsSource& source_;
  hardware::ActuatorDriver& driver_;
  hardware::PinTable pins_;
  display::DisplayMapper mapper_;
  Sleeper sleeper_;
  model::loop_state state_{model::loop_state::INITIALIZING};
};

}  // namespace cluster_dial::core

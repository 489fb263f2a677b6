#include "core/dashboard.hpp"

#include <algorithm>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <thread>
#include <utility>
#include <variant>

#include "display/metric_selector.hpp"
#include "hardware/actuator_guard.hpp"

namespace cluster_dial::core {
namespace {

constexpr std::chrono::milliseconds kMaxSleepSlice{1000};

}  // namespace

void sleep_for_blocking(const std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); }

Dashboard::Dashboard(LoopConfig config, metrics::MetricsSource& source, hardware::ActuatorDriver& driver,
                     const hardware::PinTable& pins, Sleeper sleeper)
    : config_(config),
      source_(source),
      driver_(driver),
      pins_(pins),
      mapper_(driver, pins),
      sleeper_(std::move(sleeper)) {}

DashboardStats Dashboard::run(const StopRequested& stop_requested, const std::size_t max_cycles) {
  DashboardStats stats{};

  transition(model::loop_state::INITIALIZING);
  hardware::ActuatorGuard guard{driver_, pins_};

  try {
    if (config_.debug && !stop_requested()) {
      run_debug_cycle(stats, stop_requested);
    }

    for (std::size_t i = 0; (max_cycles == 0 || i < max_cycles) && !stop_requested(); ++i) {
      run_cycle(stats);
      ++stats.cycles;

      std::cerr << "[dial] sleeping " << config_.sleep_interval.count() << " seconds\n";
      wait(config_.sleep_interval, stop_requested);
    }
  } catch (const std::exception& ex) {
    std::cerr << "[dial] aborting loop: " << ex.what() << '\n';
    // The guard tears the actuators down while this unwinds.
    transition(model::loop_state::SHUTTING_DOWN);
    throw;
  }

  transition(model::loop_state::SHUTTING_DOWN);
  guard.teardown();

  std::cerr << "[dial] done after " << stats.cycles << " cycles (" << stats.successful_fetches << " ok, "
            << stats.failed_fetches << " failed)\n";
  return stats;
}

bool Dashboard::run_cycle(DashboardStats& stats) {
  std::cerr << "[dial] updating metrics\n";

  const model::fetch_result result = source_.fetch();
  if (const auto* error = std::get_if<model::fetch_error>(&result); error != nullptr) {
    ++stats.failed_fetches;
    enter_error_display(*error);
    return false;
  }

  ++stats.successful_fetches;
  transition(model::loop_state::RUNNING);

  const auto& snapshot = std::get<model::cluster_snapshot>(result);
  const model::metric& worst = display::worst_metric(snapshot);
  std::cerr << "[dial] worst metric is " << worst.name << " at " << worst.percent << "%\n";
  mapper_.display(worst);
  return true;
}

void Dashboard::run_debug_cycle(DashboardStats& stats, const StopRequested& stop_requested) {
  transition(model::loop_state::DEBUG_CYCLE);

  std::cerr << "[dial] testing indicators\n";
  set_all_indicators(hardware::PinLevel::HIGH);
  const model::fetch_result result = source_.fetch();
  set_all_indicators(hardware::PinLevel::LOW);

  if (const auto* error = std::get_if<model::fetch_error>(&result); error != nullptr) {
    ++stats.failed_fetches;
    enter_error_display(*error);
    return;
  }
  ++stats.successful_fetches;

  std::cerr << "[dial] testing pointer\n";
  const auto& snapshot = std::get<model::cluster_snapshot>(result);
  for (const model::metric* metric : {&snapshot.cpu, &snapshot.disk, &snapshot.mem}) {
    if (stop_requested()) {
      return;
    }
    mapper_.display(*metric);
    wait(config_.debug_pause, stop_requested);
  }

  std::cerr << "[dial] testing normal workflow\n";
}

void Dashboard::enter_error_display(const model::fetch_error& error) {
  std::cerr << "[dial] failed fetching metrics (" << model::to_string(error.kind) << "): " << error.reason << '\n';
  transition(model::loop_state::ERROR_DISPLAY);

  for (const unsigned int pin : pins_.indicator_pins()) {
    driver_.set_pin(pin, hardware::PinLevel::LOW);
  }
  driver_.set_pin(pins_.alarm, hardware::PinLevel::HIGH);
}

void Dashboard::set_all_indicators(const hardware::PinLevel level) {
  for (const unsigned int pin : pins_.indicator_pins()) {
    driver_.set_pin(pin, level);
  }
  driver_.set_pin(pins_.alarm, level);
}

void Dashboard::transition(const model::loop_state next) {
  if (next != state_) {
    std::cerr << "[dial] state " << model::to_string(state_) << " -> " << model::to_string(next) << '\n';
  }
  state_ = next;
}

void Dashboard::wait(const std::chrono::milliseconds duration, const StopRequested& stop_requested) {
  auto remaining = duration;
  while (remaining.count() > 0 && !stop_requested()) {
    const auto slice = std::min(remaining, kMaxSleepSlice);
    sleeper_(slice);
    remaining -= slice;
  }
}

}  // namespace cluster_dial::core

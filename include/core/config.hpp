#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "hardware/pins.hpp"
#include "metrics/newrelic_insights.hpp"

namespace cluster_dial::core {

enum class DriverKind : std::uint8_t {
  PIGPIO = 0,
  NONE = 1,
};

struct LoopConfig {
  std::chrono::seconds sleep_interval{43200};
  bool debug{false};
  std::chrono::seconds debug_pause{5};
};

struct HardwareConfig {
  DriverKind driver{DriverKind::PIGPIO};
  hardware::PinTable pins{};
  hardware::PointerOptions pointer{};
};

struct DialConfig {
  LoopConfig loop{};
  metrics::NewRelicOptions newrelic{};
  HardwareConfig hardware{};
};

DialConfig load_dial_config(const std::string& path);

// SLEEP_SECONDS, DEBUG, NEW_RELIC_ACCOUNT_ID, INSIGHTS_QUERY, NEW_RELIC_INSIGHTS_QUERY_KEY.
void apply_env_overrides(DialConfig& config);

// Cross-field checks (distinct pins, pulse range). Throws std::runtime_error.
void validate_dial_config(const DialConfig& config);

const char* to_string(DriverKind kind) noexcept;

}  // namespace cluster_dial::core

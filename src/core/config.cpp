#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace cluster_dial::core {
namespace {

constexpr long long kMaxBcmPin = 53;
constexpr long long kMinPulseUs = 500;
constexpr long long kMaxPulseUs = 2500;

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = to_lower(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::logic_error&) {
    throw std::invalid_argument(key + " must be an integer, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::invalid_argument(key + " must be an integer, got '" + value + "'");
  }
  return parsed;
}

long long parse_positive(const std::string& key, const std::string& value) {
  const long long parsed = parse_integer(key, value);
  if (parsed <= 0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return parsed;
}

unsigned int parse_pin(const std::string& key, const std::string& value) {
  const long long parsed = parse_integer(key, value);
  if (parsed < 0 || parsed > kMaxBcmPin) {
    throw std::runtime_error(key + " must be in range 0.." + std::to_string(kMaxBcmPin));
  }
  return static_cast<unsigned int>(parsed);
}

unsigned int parse_pulse(const std::string& key, const std::string& value) {
  const long long parsed = parse_integer(key, value);
  if (parsed < kMinPulseUs || parsed > kMaxPulseUs) {
    throw std::runtime_error(key + " must be in range " + std::to_string(kMinPulseUs) + ".." +
                             std::to_string(kMaxPulseUs));
  }
  return static_cast<unsigned int>(parsed);
}

void apply_key_value(DialConfig& config, const std::string& key, const std::string& value) {
  if (key == "loop.sleep_seconds") {
    config.loop.sleep_interval = std::chrono::seconds(parse_positive(key, value));
    return;
  }

  if (key == "loop.debug") {
    config.loop.debug = parse_bool(value);
    return;
  }

  if (key == "loop.debug_pause_seconds") {
    const long long seconds = parse_integer(key, value);
    if (seconds < 0) {
      throw std::runtime_error(key + " must be greater than or equal to 0");
    }
    config.loop.debug_pause = std::chrono::seconds(seconds);
    return;
  }

  if (key == "newrelic.endpoint") {
    if (value.rfind("http://", 0) != 0 && value.rfind("https://", 0) != 0) {
      throw std::runtime_error("newrelic.endpoint must start with http:// or https://");
    }
    config.newrelic.endpoint = value;
    return;
  }

  if (key == "newrelic.account_id") {
    config.newrelic.account_id = value;
    return;
  }

  if (key == "newrelic.query") {
    config.newrelic.query = value;
    return;
  }

  if (key == "newrelic.query_key") {
    config.newrelic.query_key = value;
    return;
  }

  if (key == "newrelic.timeout_ms") {
    config.newrelic.timeout = std::chrono::milliseconds(parse_positive(key, value));
    return;
  }

  if (key == "hardware.driver") {
    const std::string driver = to_lower(value);
    if (driver == "pigpio") {
      config.hardware.driver = DriverKind::PIGPIO;
    } else if (driver == "none") {
      config.hardware.driver = DriverKind::NONE;
    } else {
      throw std::runtime_error("hardware.driver must be 'pigpio' or 'none', got '" + value + "'");
    }
    return;
  }

  if (key == "hardware.pins.pointer") {
    config.hardware.pins.pointer = parse_pin(key, value);
    return;
  }
  if (key == "hardware.pins.cpu") {
    config.hardware.pins.cpu = parse_pin(key, value);
    return;
  }
  if (key == "hardware.pins.memory") {
    config.hardware.pins.memory = parse_pin(key, value);
    return;
  }
  if (key == "hardware.pins.disk") {
    config.hardware.pins.disk = parse_pin(key, value);
    return;
  }
  if (key == "hardware.pins.alarm") {
    config.hardware.pins.alarm = parse_pin(key, value);
    return;
  }

  if (key == "hardware.pointer.settle_ms") {
    const long long settle_ms = parse_integer(key, value);
    if (settle_ms < 0) {
      throw std::runtime_error(key + " must be greater than or equal to 0");
    }
    config.hardware.pointer.settle = std::chrono::milliseconds(settle_ms);
    return;
  }

  if (key == "hardware.pointer.min_pulse_us") {
    config.hardware.pointer.min_pulse_us = parse_pulse(key, value);
    return;
  }

  if (key == "hardware.pointer.max_pulse_us") {
    config.hardware.pointer.max_pulse_us = parse_pulse(key, value);
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

void apply_env(DialConfig& config, const char* name, const std::string& key) {
  if (const auto* value = std::getenv(name); value != nullptr) {
    std::cerr << "[config] " << name << " overrides " << key << '\n';
    apply_key_value(config, key, trim(value));
  }
}

}  // namespace

DialConfig load_dial_config(const std::string& path) {
  DialConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = unquote(trim(stripped.substr(colon_pos + 1)));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate_dial_config(config);
  return config;
}

void apply_env_overrides(DialConfig& config) {
  apply_env(config, "SLEEP_SECONDS", "loop.sleep_seconds");
  apply_env(config, "DEBUG", "loop.debug");
  apply_env(config, "NEW_RELIC_ACCOUNT_ID", "newrelic.account_id");
  apply_env(config, "INSIGHTS_QUERY", "newrelic.query");
  apply_env(config, "NEW_RELIC_INSIGHTS_QUERY_KEY", "newrelic.query_key");

  validate_dial_config(config);
}

void validate_dial_config(const DialConfig& config) {
  std::unordered_set<unsigned int> seen;
  for (const unsigned int pin : config.hardware.pins.all_pins()) {
    if (!seen.insert(pin).second) {
      throw std::runtime_error("hardware.pins must be distinct; pin " + std::to_string(pin) + " is used twice");
    }
  }

  if (config.hardware.pointer.min_pulse_us >= config.hardware.pointer.max_pulse_us) {
    throw std::runtime_error("hardware.pointer.min_pulse_us must be less than hardware.pointer.max_pulse_us");
  }
}

const char* to_string(const DriverKind kind) noexcept {
  switch (kind) {
    case DriverKind::PIGPIO:
      return "pigpio";
    case DriverKind::NONE:
      return "none";
  }
  return "unknown";
}

}  // namespace cluster_dial::core

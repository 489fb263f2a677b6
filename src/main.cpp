#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "core/config.hpp"
#include "core/dashboard.hpp"
#include "hardware/actuator.hpp"
#include "metrics/http_transport.hpp"
#include "metrics/newrelic_insights.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

std::string format_config_settings(const cluster_dial::core::DialConfig& config, const std::string& config_path) {
  const auto& pins = config.hardware.pins;
  std::ostringstream output;
  output << "[dial] loaded config from " << config_path
         << " | sleep_seconds=" << config.loop.sleep_interval.count()
         << " | debug=" << (config.loop.debug ? "true" : "false")
         << " | newrelic_endpoint=" << config.newrelic.endpoint
         << " | account_id=" << (config.newrelic.account_id.empty() ? "<unset>" : config.newrelic.account_id)
         << " | query_key=" << (config.newrelic.query_key.empty() ? "<unset>" : "<redacted>")
         << " | driver=" << cluster_dial::core::to_string(config.hardware.driver)
         << " | pins=pointer:" << pins.pointer << ",cpu:" << pins.cpu << ",memory:" << pins.memory
         << ",disk:" << pins.disk << ",alarm:" << pins.alarm
         << " | settle_ms=" << config.hardware.pointer.settle.count();
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/dial.yaml";

  cluster_dial::core::DialConfig config{};
  try {
    config = cluster_dial::core::load_dial_config(config_path);
    cluster_dial::core::apply_env_overrides(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  std::unique_ptr<cluster_dial::metrics::CurlGlobal> curl;
  std::unique_ptr<cluster_dial::hardware::ActuatorDriver> driver;
  try {
    curl = std::make_unique<cluster_dial::metrics::CurlGlobal>();
  } catch (const std::exception& ex) {
    std::cerr << "http error: " << ex.what() << '\n';
    return 2;
  }

  try {
    if (config.hardware.driver == cluster_dial::core::DriverKind::PIGPIO) {
      driver = cluster_dial::hardware::make_pigpio_driver(config.hardware.pins, config.hardware.pointer);
    } else {
      driver = cluster_dial::hardware::make_none_driver(config.hardware.pins, config.hardware.pointer);
    }
    if (!driver->available()) {
      std::cerr << "[dial] running without hardware; actuator commands are only logged\n";
    }
  } catch (const std::exception& ex) {
    std::cerr << "actuator error: " << ex.what() << '\n';
    return 2;
  }

  cluster_dial::metrics::NewRelicInsightsSource source{config.newrelic};
  cluster_dial::core::Dashboard dashboard{config.loop, source, *driver, config.hardware.pins};

  try {
    dashboard.run([] { return g_shutdown_requested != 0; });
  } catch (const cluster_dial::hardware::ActuatorError& ex) {
    std::cerr << "actuator error: " << ex.what() << '\n';
    return 3;
  }

  if (g_shutdown_requested != 0) {
    std::cerr << "[dial] shutdown signal received; exiting cleanly\n";
  }

  return 0;
}

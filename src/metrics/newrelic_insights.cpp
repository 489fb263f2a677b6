#include "metrics/newrelic_insights.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/math.hpp"

namespace cluster_dial::metrics {
namespace {

constexpr std::size_t kMaxLoggedBodyBytes = 512;

model::fetch_error make_error(const model::fetch_error_kind kind, std::string reason) {
  return model::fetch_error{kind, std::move(reason)};
}

std::string truncate_body(const std::string& body) {
  if (body.size() <= kMaxLoggedBodyBytes) {
    return body;
  }
  return body.substr(0, kMaxLoggedBodyBytes) + "...";
}

std::string trim_trailing_slashes(std::string value) {
  while (!value.empty() && value.back() == '/') {
    value.pop_back();
  }
  return value;
}

// Throws nlohmann::json::exception when the field is missing.
std::optional<int> read_percent(const nlohmann::json& event, const char* field, std::string& reason) {
  const auto& value = event.at(field);
  if (!value.is_number()) {
    reason = std::string(field) + " is not a number";
    return std::nullopt;
  }

  const double ratio = value.get<double>();
  if (!std::isfinite(ratio) || ratio < 0.0) {
    reason = std::string(field) + " is out of range: " + std::to_string(ratio);
    return std::nullopt;
  }
  return core::percent_from_ratio(ratio);
}

}  // namespace

NewRelicInsightsSource::NewRelicInsightsSource(NewRelicOptions options, HttpTransport transport)
    : options_(std::move(options)), transport_(std::move(transport)) {}

std::optional<HttpRequest> NewRelicInsightsSource::build_request() const {
  if (options_.account_id.empty() || options_.query.empty() || options_.query_key.empty()) {
    return std::nullopt;
  }

  const auto nrql = url_escape(options_.query);
  if (!nrql.has_value()) {
    return std::nullopt;
  }

  HttpRequest request{};
  request.url = trim_trailing_slashes(options_.endpoint) + "/v1/accounts/" + options_.account_id +
                "/query?nrql=" + *nrql;
  request.headers = {{"X-Query-Key", options_.query_key}, {"Accept", "application/json"}};
  request.timeout = options_.timeout;
  return request;
}

model::fetch_result NewRelicInsightsSource::fetch() {
  std::cerr << "[newrelic] calling new relic\n";

  const auto request = build_request();
  if (!request.has_value()) {
    std::cerr << "[newrelic] account id, query and query key must all be set\n";
    return make_error(model::fetch_error_kind::NOT_CONFIGURED, "new relic account id, query or query key missing");
  }

  std::cerr << "[newrelic] calling " << request->url << '\n';
  const HttpResponse response = transport_(*request);

  if (!response.transport_ok) {
    std::cerr << "[newrelic] request failed: " << response.error << '\n';
    return make_error(model::fetch_error_kind::TRANSPORT, response.error);
  }

  if (!response.success()) {
    std::string reason = "received status " + std::to_string(response.status) + " and body " +
                         truncate_body(response.body);
    std::cerr << "[newrelic] failed to call new relic: " << reason << '\n';
    return make_error(model::fetch_error_kind::HTTP_STATUS, std::move(reason));
  }

  auto result = parse_insights_payload(response.body);
  if (const auto* error = std::get_if<model::fetch_error>(&result); error != nullptr) {
    std::cerr << "[newrelic] unusable payload: " << error->reason << '\n';
    return result;
  }

  const auto& snapshot = std::get<model::cluster_snapshot>(result);
  std::cerr << "[newrelic] cpu=" << snapshot.cpu.percent << " memory=" << snapshot.mem.percent
            << " disk=" << snapshot.disk.percent << '\n';
  return result;
}

model::fetch_result parse_insights_payload(const std::string& body) {
  const nlohmann::json document = nlohmann::json::parse(body, nullptr, false);
  if (document.is_discarded()) {
    return make_error(model::fetch_error_kind::MALFORMED_PAYLOAD, "response body is not valid JSON");
  }

  try {
    const auto& results = document.at("results");
    if (!results.is_array() || results.empty()) {
      return make_error(model::fetch_error_kind::MALFORMED_PAYLOAD, "results is empty");
    }

    const auto& events = results.front().at("events");
    if (!events.is_array() || events.empty()) {
      return make_error(model::fetch_error_kind::MALFORMED_PAYLOAD, "results[0].events is empty");
    }

    const auto& event = events.front();
    std::string reason;
    const auto cpu = read_percent(event, "cpus.percent", reason);
    const auto mem = read_percent(event, "mem.percent", reason);
    const auto disk = read_percent(event, "disk.percent", reason);
    if (!cpu.has_value() || !mem.has_value() || !disk.has_value()) {
      return make_error(model::fetch_error_kind::MALFORMED_PAYLOAD, reason);
    }

    return model::cluster_snapshot{
        model::metric{"cpu", *cpu, model::indicator::CPU},
        model::metric{"memory", *mem, model::indicator::MEMORY},
        model::metric{"disk", *disk, model::indicator::DISK},
    };
  } catch (const nlohmann::json::exception& ex) {
    return make_error(model::fetch_error_kind::MALFORMED_PAYLOAD, ex.what());
  }
}

}  // namespace cluster_dial::metrics

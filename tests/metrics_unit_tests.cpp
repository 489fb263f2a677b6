#include <chrono>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "metrics/http_transport.hpp"
#include "metrics/newrelic_insights.hpp"
#include "model/cluster_snapshot.hpp"

using cluster_dial::metrics::HttpRequest;
using cluster_dial::metrics::HttpResponse;
using cluster_dial::metrics::HttpTransport;
using cluster_dial::metrics::NewRelicInsightsSource;
using cluster_dial::metrics::NewRelicOptions;
using cluster_dial::metrics::parse_insights_payload;
using cluster_dial::model::cluster_snapshot;
using cluster_dial::model::fetch_error;
using cluster_dial::model::fetch_error_kind;
using cluster_dial::model::fetch_result;
using cluster_dial::model::indicator;

namespace {

constexpr const char* kHealthyPayload = R"({
  "results": [
    {"events": [{"cpus.percent": 0.421, "mem.percent": 0.5, "disk.percent": 0.0001, "timestamp": 1514764800000}]}
  ],
  "metadata": {"eventTypes": ["ClusterSample"]}
})";

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

NewRelicOptions configured_options() {
  NewRelicOptions options{};
  options.endpoint = "https://insights.example.test/";
  options.account_id = "12345";
  options.query = "SELECT latest(cpus.percent) FROM ClusterSample";
  options.query_key = "secret-key";
  options.timeout = std::chrono::milliseconds(2500);
  return options;
}

struct TransportProbe {
  std::vector<HttpRequest> requests{};
  HttpResponse response{};
};

HttpTransport replay(TransportProbe& probe) {
  return [&probe](const HttpRequest& request) {
    probe.requests.push_back(request);
    return probe.response;
  };
}

HttpResponse ok_response(const std::string& body) {
  HttpResponse response{};
  response.transport_ok = true;
  response.status = 200;
  response.body = body;
  return response;
}

bool is_error_of(const fetch_result& result, const fetch_error_kind kind) {
  const auto* error = std::get_if<fetch_error>(&result);
  return error != nullptr && error->kind == kind;
}

int test_payload_percentages_round_up() {
  const auto result = parse_insights_payload(kHealthyPayload);
  const auto* snapshot = std::get_if<cluster_snapshot>(&result);
  if (snapshot == nullptr) {
    return fail("test_payload_percentages_round_up", "healthy payload should parse");
  }
  if (snapshot->cpu.percent != 43 || snapshot->mem.percent != 50 || snapshot->disk.percent != 1) {
    return fail("test_payload_percentages_round_up", "ceiling rounding mismatch");
  }
  if (snapshot->cpu.name != "cpu" || snapshot->mem.name != "memory" || snapshot->disk.name != "disk") {
    return fail("test_payload_percentages_round_up", "metric names mismatch");
  }
  if (snapshot->cpu.led != indicator::CPU || snapshot->mem.led != indicator::MEMORY ||
      snapshot->disk.led != indicator::DISK) {
    return fail("test_payload_percentages_round_up", "indicator assignment mismatch");
  }
  return 0;
}

int test_payload_clamps_overfull_ratio() {
  const auto result = parse_insights_payload(
      R"({"results":[{"events":[{"cpus.percent":1.02,"mem.percent":1,"disk.percent":0}]}]})");
  const auto* snapshot = std::get_if<cluster_snapshot>(&result);
  if (snapshot == nullptr) {
    return fail("test_payload_clamps_overfull_ratio", "payload should parse");
  }
  if (snapshot->cpu.percent != 100 || snapshot->mem.percent != 100 || snapshot->disk.percent != 0) {
    return fail("test_payload_clamps_overfull_ratio", "percent must stay within [0, 100]");
  }
  return 0;
}

int test_malformed_payloads_are_fetch_errors() {
  const std::vector<std::string> bodies = {
      "not json at all",
      R"({"results":[]})",
      R"({"results":[{"events":[]}]})",
      R"({"results":[{"events":[{"cpus.percent":0.5,"mem.percent":0.5}]}]})",
      R"({"results":[{"events":[{"cpus.percent":"high","mem.percent":0.5,"disk.percent":0.5}]}]})",
      R"({"results":[{"events":[{"cpus.percent":-0.2,"mem.percent":0.5,"disk.percent":0.5}]}]})",
      R"({"results":[{"events":[{"cpus.percent":true,"mem.percent":0.5,"disk.percent":0.5}]}]})",
      R"({"results":{"events":[]}})",
      R"([1, 2, 3])",
  };

  for (const auto& body : bodies) {
    if (!is_error_of(parse_insights_payload(body), fetch_error_kind::MALFORMED_PAYLOAD)) {
      std::cerr << "body: " << body << '\n';
      return fail("test_malformed_payloads_are_fetch_errors", "payload should be rejected as malformed");
    }
  }
  return 0;
}

int test_request_carries_account_query_and_key() {
  TransportProbe probe;
  probe.response = ok_response(kHealthyPayload);
  NewRelicInsightsSource source{configured_options(), replay(probe)};

  const auto result = source.fetch();
  if (!std::holds_alternative<cluster_snapshot>(result)) {
    return fail("test_request_carries_account_query_and_key", "fetch should succeed");
  }
  if (probe.requests.size() != 1U) {
    return fail("test_request_carries_account_query_and_key", "exactly one request expected");
  }

  const HttpRequest& request = probe.requests.front();
  const std::string expected_prefix = "https://insights.example.test/v1/accounts/12345/query?nrql=";
  if (request.url.rfind(expected_prefix, 0) != 0) {
    std::cerr << "url: " << request.url << '\n';
    return fail("test_request_carries_account_query_and_key", "url prefix mismatch");
  }
  if (request.url.find(' ') != std::string::npos || request.url.find("SELECT") == std::string::npos) {
    return fail("test_request_carries_account_query_and_key", "query should be url-escaped");
  }

  bool has_key = false;
  bool has_accept = false;
  for (const auto& [name, value] : request.headers) {
    has_key = has_key || (name == "X-Query-Key" && value == "secret-key");
    has_accept = has_accept || (name == "Accept" && value == "application/json");
  }
  if (!has_key || !has_accept) {
    return fail("test_request_carries_account_query_and_key", "headers mismatch");
  }
  if (request.timeout != std::chrono::milliseconds(2500)) {
    return fail("test_request_carries_account_query_and_key", "timeout should follow options");
  }

  return 0;
}

int test_transport_and_status_failures() {
  TransportProbe probe;
  NewRelicInsightsSource source{configured_options(), replay(probe)};

  probe.response = HttpResponse{};
  probe.response.error = "Could not resolve host";
  if (!is_error_of(source.fetch(), fetch_error_kind::TRANSPORT)) {
    return fail("test_transport_and_status_failures", "transport failure should map to TRANSPORT");
  }

  probe.response = ok_response(R"({"error":"Invalid query key"})");
  probe.response.status = 403;
  const auto forbidden = source.fetch();
  if (!is_error_of(forbidden, fetch_error_kind::HTTP_STATUS)) {
    return fail("test_transport_and_status_failures", "403 should map to HTTP_STATUS");
  }
  const auto& reason = std::get<fetch_error>(forbidden).reason;
  if (reason.find("403") == std::string::npos || reason.find("Invalid query key") == std::string::npos) {
    return fail("test_transport_and_status_failures", "reason should carry status and body");
  }

  probe.response = ok_response("<html>maintenance</html>");
  if (!is_error_of(source.fetch(), fetch_error_kind::MALFORMED_PAYLOAD)) {
    return fail("test_transport_and_status_failures", "html body should map to MALFORMED_PAYLOAD");
  }

  return 0;
}

int test_missing_credentials_skip_the_request() {
  TransportProbe probe;
  probe.response = ok_response(kHealthyPayload);

  NewRelicOptions options = configured_options();
  options.query_key.clear();
  NewRelicInsightsSource source{options, replay(probe)};

  if (!is_error_of(source.fetch(), fetch_error_kind::NOT_CONFIGURED)) {
    return fail("test_missing_credentials_skip_the_request", "missing key should be NOT_CONFIGURED");
  }
  if (!probe.requests.empty()) {
    return fail("test_missing_credentials_skip_the_request", "no request should be sent");
  }
  if (source.build_request().has_value()) {
    return fail("test_missing_credentials_skip_the_request", "build_request should refuse incomplete options");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_payload_percentages_round_up(); rc != 0) return rc;
  if (int rc = test_payload_clamps_overfull_ratio(); rc != 0) return rc;
  if (int rc = test_malformed_payloads_are_fetch_errors(); rc != 0) return rc;
  if (int rc = test_request_carries_account_query_and_key(); rc != 0) return rc;
  if (int rc = test_transport_and_status_failures(); rc != 0) return rc;
  if (int rc = test_missing_credentials_skip_the_request(); rc != 0) return rc;

  std::cout << "[PASS] metrics unit tests\n";
  return 0;
}

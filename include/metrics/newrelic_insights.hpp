#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "metrics/http_transport.hpp"
#include "metrics/source.hpp"
#include "model/cluster_snapshot.hpp"

namespace cluster_dial::metrics {

struct NewRelicOptions {
  std::string endpoint{"https://insights-api.newrelic.com"};
  std::string account_id{};
  std::string query{};
  std::string query_key{};
  std::chrono::milliseconds timeout{10000};
};

class NewRelicInsightsSource final : public MetricsSource {
 public:
  explicit NewRelicInsightsSource(NewRelicOptions options, HttpTransport transport = make_curl_transport());

  model::fetch_result fetch() override;

  // Empty when the options are incomplete or the query cannot be escaped.
  [[nodiscard]] std::optional<HttpRequest> build_request() const;

 private:
  NewRelicOptions options_;
  HttpTransport transport_;
};

// Reads cpus.percent, mem.percent and disk.percent from results[0].events[0].
model::fetch_result parse_insights_payload(const std::string& body);

}  // namespace cluster_dial::metrics

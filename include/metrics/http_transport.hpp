#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cluster_dial::metrics {

struct HttpRequest {
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers{};
  std::chrono::milliseconds timeout{10000};
};

struct HttpResponse {
  bool transport_ok{false};
  long status{0};
  std::string body{};
  std::string error{};

  [[nodiscard]] bool success() const noexcept { return transport_ok && status >= 200 && status < 300; }
};

using HttpTransport = std::function<HttpResponse(const HttpRequest&)>;

// Blocking GET through libcurl. Requires a live CurlGlobal.
HttpTransport make_curl_transport();

std::optional<std::string> url_escape(const std::string& value);

// curl_global_init/curl_global_cleanup for the lifetime of main().
class CurlGlobal {
 public:
  CurlGlobal();
  ~CurlGlobal();

  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

}  // namespace cluster_dial::metrics

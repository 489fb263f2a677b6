#include "metrics/http_transport.hpp"

#include <cstddef>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <curl/curl.h>

namespace cluster_dial::metrics {
namespace {

struct EasyDeleter {
  void operator()(CURL* handle) const {
    if (handle != nullptr) {
      curl_easy_cleanup(handle);
    }
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    if (list != nullptr) {
      curl_slist_free_all(list);
    }
  }
};

struct CurlStringDeleter {
  void operator()(char* value) const {
    if (value != nullptr) {
      curl_free(value);
    }
  }
};

using EasyPtr = std::unique_ptr<CURL, EasyDeleter>;
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

std::size_t append_body(char* data, const std::size_t size, const std::size_t count, void* user) {
  auto* body = static_cast<std::string*>(user);
  body->append(data, size * count);
  return size * count;
}

template <typename T>
bool set_option(CURL* handle, const CURLoption option, T value) {
  return curl_easy_setopt(handle, option, value) == CURLE_OK;
}

HttpResponse failed(std::string error) {
  HttpResponse response{};
  response.transport_ok = false;
  response.error = std::move(error);
  return response;
}

HttpResponse curl_get(const HttpRequest& request) {
  EasyPtr handle(curl_easy_init());
  if (handle == nullptr) {
    return failed("curl_easy_init failed");
  }

  SlistPtr headers;
  for (const auto& [name, value] : request.headers) {
    const std::string line = name + ": " + value;
    curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
    if (appended == nullptr) {
      return failed("curl_slist_append failed");
    }
    static_cast<void>(headers.release());
    headers.reset(appended);
  }

  HttpResponse response{};
  char error_buffer[CURL_ERROR_SIZE]{};

  const bool configured = set_option(handle.get(), CURLOPT_ERRORBUFFER, static_cast<char*>(error_buffer)) &&
                          set_option(handle.get(), CURLOPT_URL, request.url.c_str()) &&
                          set_option(handle.get(), CURLOPT_HTTPHEADER, headers.get()) &&
                          set_option(handle.get(), CURLOPT_WRITEFUNCTION, &append_body) &&
                          set_option(handle.get(), CURLOPT_WRITEDATA, static_cast<void*>(&response.body)) &&
                          set_option(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count())) &&
                          set_option(handle.get(), CURLOPT_NOSIGNAL, 1L) &&
                          set_option(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
  if (!configured) {
    return failed("unable to configure curl handle");
  }

  const CURLcode rc = curl_easy_perform(handle.get());
  if (rc != CURLE_OK) {
    std::cerr << "[http] " << curl_easy_strerror(rc) << '\n';
    return failed(error_buffer[0] != '\0' ? std::string(error_buffer) : std::string(curl_easy_strerror(rc)));
  }

  long status = 0;
  if (curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status) != CURLE_OK) {
    return failed("unable to read HTTP status");
  }

  response.transport_ok = true;
  response.status = status;
  std::cerr << "[http] status " << status << ", " << response.body.size() << " bytes\n";
  return response;
}

}  // namespace

HttpTransport make_curl_transport() { return curl_get; }

std::optional<std::string> url_escape(const std::string& value) {
  std::unique_ptr<char, CurlStringDeleter> escaped(
      curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size())));
  if (escaped == nullptr) {
    return std::nullopt;
  }
  return std::string(escaped.get());
}

CurlGlobal::CurlGlobal() {
  const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (rc != CURLE_OK) {
    throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
  }
}

CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

}  // namespace cluster_dial::metrics

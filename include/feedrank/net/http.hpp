#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace feedrank::net {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool success() const {
    return !timeout && !network_error && status >= 200 && status < 300;
  }
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse
  get(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
      std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse
  get(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
      std::uint64_t timeout_ms) override;
};

/// Percent-encode a query parameter value.
[[nodiscard]] std::string url_encode(const std::string &value);

} // namespace feedrank::net

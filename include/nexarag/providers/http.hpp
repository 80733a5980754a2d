#pragma once

#include "nexarag/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace nexarag::providers {

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  HttpHeaders headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse put_json(const std::string &url, const HttpHeaders &headers,
                                              const std::string &body,
                                              std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                         std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse del(const std::string &url, const HttpHeaders &headers,
                                         std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();

  [[nodiscard]] HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body,
                                       std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse put_json(const std::string &url, const HttpHeaders &headers,
                                      const std::string &body, std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                 std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse del(const std::string &url, const HttpHeaders &headers,
                                 std::uint64_t timeout_ms) override;
};

enum class ProviderErrorCode {
  ApiError,
  NetworkError,
  AuthError,
  RateLimitError,
  ModelNotFound,
  InvalidResponse,
  Timeout,
};

struct ProviderError {
  ProviderErrorCode code = ProviderErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after;

  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] common::ErrorCode error_code(common::ErrorCode terminal) const;
};

[[nodiscard]] std::optional<ProviderError> classify_response(const HttpResponse &response);

[[nodiscard]] std::string strip_trailing_slashes(std::string url);

} // namespace nexarag::providers

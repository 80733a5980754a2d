#include "nexarag/providers/http.hpp"

#include "nexarag/common/fs.hpp"

#include <curl/curl.h>

#include <charconv>
#include <mutex>
#include <sstream>

namespace nexarag::providers {

namespace {

constexpr std::size_t MAX_ERROR_BODY = 512;

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  static_cast<std::string *>(userdata)->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  const std::string header(buffer, total);
  auto *headers = static_cast<HttpHeaders *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    (*headers)[common::to_lower(common::trim(header.substr(0, separator)))] =
        common::trim(header.substr(separator + 1));
  }
  return total;
}

HttpResponse execute_request(const char *method, const std::string &url,
                             const HttpHeaders &headers, const std::optional<std::string> &body,
                             const std::uint64_t timeout_ms) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "NexaRag/0.1");
  curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method);

  if (body.has_value()) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
  }

  struct curl_slist *header_list = nullptr;
  if (body.has_value()) {
    header_list = curl_slist_append(header_list, "Content-Type: application/json");
  }
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

std::string truncate_body(const std::string &body) {
  if (body.size() <= MAX_ERROR_BODY) {
    return body;
  }
  return body.substr(0, MAX_ERROR_BODY) + "...";
}

} // namespace

CurlHttpClient::CurlHttpClient() {
  static std::once_flag init_flag;
  std::call_once(init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlHttpClient::post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  return execute_request("POST", url, headers, body, timeout_ms);
}

HttpResponse CurlHttpClient::put_json(const std::string &url, const HttpHeaders &headers,
                                      const std::string &body, const std::uint64_t timeout_ms) {
  return execute_request("PUT", url, headers, body, timeout_ms);
}

HttpResponse CurlHttpClient::get(const std::string &url, const HttpHeaders &headers,
                                 const std::uint64_t timeout_ms) {
  return execute_request("GET", url, headers, std::nullopt, timeout_ms);
}

HttpResponse CurlHttpClient::del(const std::string &url, const HttpHeaders &headers,
                                 const std::uint64_t timeout_ms) {
  return execute_request("DELETE", url, headers, std::nullopt, timeout_ms);
}

std::string ProviderError::to_string() const {
  std::ostringstream stream;
  stream << "Provider error [";
  switch (code) {
  case ProviderErrorCode::ApiError:
    stream << "api";
    break;
  case ProviderErrorCode::NetworkError:
    stream << "network";
    break;
  case ProviderErrorCode::AuthError:
    stream << "auth";
    break;
  case ProviderErrorCode::RateLimitError:
    stream << "rate_limit";
    break;
  case ProviderErrorCode::ModelNotFound:
    stream << "model_not_found";
    break;
  case ProviderErrorCode::InvalidResponse:
    stream << "invalid_response";
    break;
  case ProviderErrorCode::Timeout:
    stream << "timeout";
    break;
  }
  stream << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  if (retry_after.has_value()) {
    stream << " retry_after=" << *retry_after;
  }
  if (!message.empty()) {
    stream << " " << message;
  }
  return stream.str();
}

common::ErrorCode ProviderError::error_code(const common::ErrorCode terminal) const {
  switch (code) {
  case ProviderErrorCode::Timeout:
    return common::ErrorCode::Timeout;
  case ProviderErrorCode::NetworkError:
  case ProviderErrorCode::RateLimitError:
    return common::ErrorCode::Unavailable;
  case ProviderErrorCode::ApiError:
    return status >= 500 ? common::ErrorCode::Unavailable : terminal;
  case ProviderErrorCode::AuthError:
  case ProviderErrorCode::ModelNotFound:
  case ProviderErrorCode::InvalidResponse:
    return terminal;
  }
  return terminal;
}

std::optional<ProviderError> classify_response(const HttpResponse &response) {
  if (response.timeout) {
    return ProviderError{.code = ProviderErrorCode::Timeout, .message = "request timed out"};
  }
  if (response.network_error) {
    return ProviderError{.code = ProviderErrorCode::NetworkError,
                         .message = response.network_error_message};
  }
  if (response.status >= 200 && response.status < 300) {
    return std::nullopt;
  }

  ProviderError error{.status = response.status, .message = truncate_body(response.body)};
  if (response.status == 401 || response.status == 403) {
    error.code = ProviderErrorCode::AuthError;
  } else if (response.status == 404) {
    error.code = ProviderErrorCode::ModelNotFound;
  } else if (response.status == 429) {
    error.code = ProviderErrorCode::RateLimitError;
    if (const auto it = response.headers.find("retry-after"); it != response.headers.end()) {
      std::uint64_t seconds = 0;
      const auto &raw = it->second;
      const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), seconds);
      if (ec == std::errc() && ptr == raw.data() + raw.size()) {
        error.retry_after = seconds;
      }
    }
  } else {
    error.code = ProviderErrorCode::ApiError;
  }
  return error;
}

std::string strip_trailing_slashes(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

} // namespace nexarag::providers

#include "nexarag/providers/compatible.hpp"

#include "nexarag/common/fs.hpp"
#include "nexarag/common/json_util.hpp"

#include <sstream>

namespace nexarag::providers {

namespace {

common::Result<std::string> request_failure(const HttpResponse &response) {
  const auto error = classify_response(response);
  return common::Result<std::string>::failure(
      error->error_code(common::ErrorCode::GenerationFailed), "cloud: " + error->to_string());
}

} // namespace

common::Result<std::string> parse_openai_content(const std::string &response) {
  const auto choices = common::json_split_top_level_objects(common::json_get_array(response, "choices"));
  if (choices.empty()) {
    return common::Result<std::string>::failure(
        common::ErrorCode::GenerationFailed,
        ProviderError{.code = ProviderErrorCode::InvalidResponse, .message = "no choices"}
            .to_string());
  }
  const std::string message = common::json_get_object(choices.front(), "message");
  if (message.empty()) {
    return common::Result<std::string>::failure(
        common::ErrorCode::GenerationFailed,
        ProviderError{.code = ProviderErrorCode::InvalidResponse, .message = "message missing"}
            .to_string());
  }
  return common::Result<std::string>::success(
      common::trim(common::json_get_string(message, "content")));
}

CompatibleProvider::CompatibleProvider(config::CloudConfig config, GenerationParams params,
                                       std::shared_ptr<HttpClient> http_client)
    : config_(std::move(config)), params_(params), http_client_(std::move(http_client)) {
  config_.base_url = strip_trailing_slashes(config_.base_url);
}

HttpHeaders CompatibleProvider::auth_headers() const {
  return {{"Authorization", "Bearer " + config_.api_key}};
}

std::string CompatibleProvider::build_body(const GenerationRequest &request) const {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(config_.model) << "\",";
  body << "\"messages\":[";
  if (!request.system_prompt.empty()) {
    body << "{\"role\":\"system\",\"content\":\"" << common::json_escape(request.system_prompt)
         << "\"},";
  }
  body << "{\"role\":\"user\",\"content\":\"" << common::json_escape(request.prompt) << "\"}";
  body << "],";
  body << "\"temperature\":" << request.temperature.value_or(params_.temperature) << ",";
  body << "\"top_p\":" << params_.top_p << ",";
  body << "\"max_tokens\":" << request.max_tokens.value_or(params_.max_tokens) << ",";
  body << "\"stream\":false";
  body << "}";
  return body.str();
}

common::Result<std::string> CompatibleProvider::generate(const GenerationRequest &request) {
  if (config_.api_key.empty()) {
    return common::Result<std::string>::failure(common::ErrorCode::Configuration,
                                                "cloud provider: missing API key");
  }
  if (request.cancel != nullptr && request.cancel->cancelled()) {
    return common::Result<std::string>::failure(common::ErrorCode::Cancelled,
                                                "generation cancelled");
  }

  const auto response = http_client_->post_json(config_.base_url + "/chat/completions",
                                                auth_headers(), build_body(request),
                                                params_.timeout_ms);
  if (classify_response(response).has_value()) {
    return request_failure(response);
  }
  return parse_openai_content(response.body);
}

common::Result<std::vector<std::string>> CompatibleProvider::list_models() {
  using ModelsResult = common::Result<std::vector<std::string>>;
  if (config_.api_key.empty()) {
    return ModelsResult::failure(common::ErrorCode::Configuration,
                                 "cloud provider: missing API key");
  }
  const auto response =
      http_client_->get(config_.base_url + "/models", auth_headers(), params_.timeout_ms);
  if (classify_response(response).has_value()) {
    const auto failure = request_failure(response);
    return ModelsResult::failure(failure.code(), failure.error());
  }
  std::vector<std::string> models;
  for (const auto &item :
       common::json_split_top_level_objects(common::json_get_array(response.body, "data"))) {
    const std::string id = common::json_get_string(item, "id");
    if (!id.empty()) {
      models.push_back(id);
    }
  }
  return ModelsResult::success(std::move(models));
}

ProviderStatus CompatibleProvider::status() {
  ProviderStatus out{.provider = name(),
                     .model = config_.model,
                     .base_url = config_.base_url,
                     .ready = false,
                     .models_available = {},
                     .detail = ""};
  auto models = list_models();
  if (!models.ok()) {
    out.detail = models.error();
    return out;
  }
  out.models_available = models.value();
  out.ready = true;
  return out;
}

} // namespace nexarag::providers

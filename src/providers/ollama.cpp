#include "nexarag/providers/ollama.hpp"

#include "nexarag/common/fs.hpp"
#include "nexarag/common/json_util.hpp"

#include <sstream>

namespace nexarag::providers {

namespace {

common::Result<std::string> request_failure(const HttpResponse &response) {
  const auto error = classify_response(response);
  return common::Result<std::string>::failure(
      error->error_code(common::ErrorCode::GenerationFailed), "ollama: " + error->to_string());
}

common::Result<std::string> invalid_response(const std::string &detail) {
  return common::Result<std::string>::failure(
      common::ErrorCode::GenerationFailed,
      "ollama: " +
          ProviderError{.code = ProviderErrorCode::InvalidResponse, .message = detail}.to_string());
}

} // namespace

OllamaProvider::OllamaProvider(config::OllamaConfig config, GenerationParams params,
                               std::shared_ptr<HttpClient> http_client)
    : config_(std::move(config)), params_(params), http_client_(std::move(http_client)) {
  config_.base_url = strip_trailing_slashes(config_.base_url);
}

std::string OllamaProvider::options_json(const GenerationRequest &request) const {
  std::ostringstream out;
  out << "{\"temperature\":" << request.temperature.value_or(params_.temperature) << ",";
  out << "\"top_p\":" << params_.top_p << ",";
  out << "\"num_predict\":" << request.max_tokens.value_or(params_.max_tokens) << "}";
  return out.str();
}

common::Result<std::string> OllamaProvider::generate(const GenerationRequest &request) {
  if (request.cancel != nullptr && request.cancel->cancelled()) {
    return common::Result<std::string>::failure(common::ErrorCode::Cancelled,
                                                "generation cancelled");
  }

  std::ostringstream body;
  body << "{\"model\":\"" << common::json_escape(config_.model) << "\",";
  std::string url;
  if (config_.use_chat_api) {
    url = config_.base_url + "/api/chat";
    body << "\"messages\":[";
    if (!request.system_prompt.empty()) {
      body << "{\"role\":\"system\",\"content\":\"" << common::json_escape(request.system_prompt)
           << "\"},";
    }
    body << "{\"role\":\"user\",\"content\":\"" << common::json_escape(request.prompt) << "\"}],";
  } else {
    url = config_.base_url + "/api/generate";
    body << "\"prompt\":\"" << common::json_escape(request.prompt) << "\",";
    if (!request.system_prompt.empty()) {
      body << "\"system\":\"" << common::json_escape(request.system_prompt) << "\",";
    }
  }
  body << "\"stream\":false,\"options\":" << options_json(request) << "}";

  const auto response = http_client_->post_json(url, {}, body.str(), params_.timeout_ms);
  if (classify_response(response).has_value()) {
    return request_failure(response);
  }

  if (config_.use_chat_api) {
    const std::string message = common::json_get_object(response.body, "message");
    if (message.empty()) {
      return invalid_response("message field missing");
    }
    return common::Result<std::string>::success(
        common::trim(common::json_get_string(message, "content")));
  }
  if (common::json_find_key(response.body, "response") == std::string::npos) {
    return invalid_response("response field missing");
  }
  return common::Result<std::string>::success(
      common::trim(common::json_get_string(response.body, "response")));
}

common::Result<std::vector<std::string>> OllamaProvider::list_models() {
  using ModelsResult = common::Result<std::vector<std::string>>;
  const auto response = http_client_->get(config_.base_url + "/api/tags", {}, params_.timeout_ms);
  if (classify_response(response).has_value()) {
    const auto failure = request_failure(response);
    return ModelsResult::failure(failure.code(), failure.error());
  }
  std::vector<std::string> models;
  for (const auto &item :
       common::json_split_top_level_objects(common::json_get_array(response.body, "models"))) {
    const std::string name = common::json_get_string(item, "name");
    if (!name.empty()) {
      models.push_back(name);
    }
  }
  return ModelsResult::success(std::move(models));
}

ProviderStatus OllamaProvider::status() {
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
  for (const auto &available : out.models_available) {
    // Ollama reports untagged models as `<name>:latest`.
    if (available == config_.model || available == config_.model + ":latest") {
      out.ready = true;
      break;
    }
  }
  if (!out.ready) {
    out.detail = "model '" + config_.model + "' is not pulled on the server";
  }
  return out;
}

} // namespace nexarag::providers

#include "nexarag/embedding/remote_embedder.hpp"

#include "nexarag/common/json_util.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <sstream>

namespace nexarag::embedding {

namespace {

std::string input_array(const std::vector<std::string> &texts) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < texts.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << '"' << common::json_escape(texts[i]) << '"';
  }
  out << ']';
  return out.str();
}

BatchResult transport_failure(const providers::HttpResponse &response, std::string_view backend) {
  const auto error = providers::classify_response(response);
  return BatchResult::failure(error->error_code(common::ErrorCode::EmbeddingUnavailable),
                              std::string(backend) + " embedding request failed: " +
                                  error->to_string());
}

BatchResult invalid_response(std::string_view backend, const std::string &detail) {
  return BatchResult::failure(
      common::ErrorCode::EmbeddingUnavailable,
      providers::ProviderError{.code = providers::ProviderErrorCode::InvalidResponse,
                               .message = std::string(backend) + ": " + detail}
          .to_string());
}

common::Status check_batch(const std::vector<Embedding> &vectors, std::size_t expected_count,
                           std::size_t dimensions, std::string_view backend) {
  if (vectors.size() != expected_count) {
    return common::Status::error(common::ErrorCode::EmbeddingUnavailable,
                                 std::string(backend) + " returned " +
                                     std::to_string(vectors.size()) + " embeddings for " +
                                     std::to_string(expected_count) + " inputs");
  }
  for (const auto &vector : vectors) {
    if (auto status = check_dimensions(vector, dimensions, backend); !status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

BatchResult embed_in_batches(const std::vector<std::string> &texts, std::size_t batch_size,
                             const std::function<BatchResult(const std::vector<std::string> &)> &fn) {
  std::vector<Embedding> out;
  out.reserve(texts.size());
  const std::size_t step = std::max<std::size_t>(batch_size, 1);
  for (std::size_t begin = 0; begin < texts.size(); begin += step) {
    const std::size_t end = std::min(begin + step, texts.size());
    const std::vector<std::string> slice(texts.begin() + static_cast<std::ptrdiff_t>(begin),
                                         texts.begin() + static_cast<std::ptrdiff_t>(end));
    auto batch = fn(slice);
    if (!batch.ok()) {
      return batch;
    }
    for (auto &vector : batch.value()) {
      out.push_back(std::move(vector));
    }
  }
  return BatchResult::success(std::move(out));
}

EmbeddingResult first_of(BatchResult batch) {
  if (!batch.ok()) {
    return batch.forward_error<Embedding>();
  }
  return EmbeddingResult::success(std::move(batch.value().front()));
}

} // namespace

OllamaEmbedder::OllamaEmbedder(RemoteEmbedderOptions options,
                               std::shared_ptr<providers::HttpClient> http_client)
    : options_(std::move(options)), http_client_(std::move(http_client)) {
  options_.base_url = providers::strip_trailing_slashes(options_.base_url);
}

EmbeddingResult OllamaEmbedder::embed(const std::string_view text) {
  return first_of(embed_chunk({std::string(text)}));
}

BatchResult OllamaEmbedder::embed_batch(const std::vector<std::string> &texts) {
  return embed_in_batches(texts, options_.batch_size,
                          [this](const std::vector<std::string> &slice) { return embed_chunk(slice); });
}

BatchResult OllamaEmbedder::embed_chunk(const std::vector<std::string> &texts) {
  std::ostringstream body;
  body << "{\"model\":\"" << common::json_escape(options_.model) << "\",";
  body << "\"input\":" << input_array(texts) << "}";

  const auto response = http_client_->post_json(options_.base_url + "/api/embed", {}, body.str(),
                                                options_.timeout_ms);
  if (providers::classify_response(response).has_value()) {
    return transport_failure(response, name());
  }

  const std::string embeddings = common::json_get_array(response.body, "embeddings");
  if (embeddings.empty()) {
    return invalid_response(name(), "embeddings field missing");
  }
  std::vector<Embedding> vectors;
  for (const auto &raw : common::json_split_top_level(embeddings, '[', ']')) {
    auto parsed = common::json_parse_float_array(raw);
    if (!parsed.has_value()) {
      return invalid_response(name(), "embedding array parse failed");
    }
    vectors.push_back(std::move(*parsed));
  }
  if (auto status = check_batch(vectors, texts.size(), options_.dimensions, name()); !status.ok()) {
    return BatchResult::failure(status.code(), status.error());
  }
  return BatchResult::success(std::move(vectors));
}

OpenAiEmbedder::OpenAiEmbedder(RemoteEmbedderOptions options,
                               std::shared_ptr<providers::HttpClient> http_client)
    : options_(std::move(options)), http_client_(std::move(http_client)) {
  options_.base_url = providers::strip_trailing_slashes(options_.base_url);
}

EmbeddingResult OpenAiEmbedder::embed(const std::string_view text) {
  return first_of(embed_chunk({std::string(text)}));
}

BatchResult OpenAiEmbedder::embed_batch(const std::vector<std::string> &texts) {
  return embed_in_batches(texts, options_.batch_size,
                          [this](const std::vector<std::string> &slice) { return embed_chunk(slice); });
}

BatchResult OpenAiEmbedder::embed_chunk(const std::vector<std::string> &texts) {
  if (options_.api_key.empty()) {
    return BatchResult::failure(common::ErrorCode::Configuration,
                                "openai embedder: missing API key");
  }

  std::ostringstream body;
  body << "{\"model\":\"" << common::json_escape(options_.model) << "\",";
  body << "\"input\":" << input_array(texts) << "}";

  const providers::HttpHeaders headers = {{"Authorization", "Bearer " + options_.api_key}};
  const auto response = http_client_->post_json(options_.base_url + "/embeddings", headers,
                                                body.str(), options_.timeout_ms);
  if (providers::classify_response(response).has_value()) {
    return transport_failure(response, name());
  }

  const std::string data = common::json_get_array(response.body, "data");
  if (data.empty()) {
    return invalid_response(name(), "data field missing");
  }
  // Entries may arrive in any order; `index` places them.
  std::vector<Embedding> vectors(texts.size());
  std::size_t filled = 0;
  for (const auto &item : common::json_split_top_level_objects(data)) {
    auto parsed = common::json_parse_float_array(common::json_get_array(item, "embedding"));
    if (!parsed.has_value()) {
      return invalid_response(name(), "embedding array parse failed");
    }
    std::size_t index = filled;
    if (const std::string raw_index = common::json_get_number(item, "index"); !raw_index.empty()) {
      index = static_cast<std::size_t>(std::strtoull(raw_index.c_str(), nullptr, 10));
    }
    if (index >= vectors.size()) {
      return invalid_response(name(), "embedding index out of range");
    }
    vectors[index] = std::move(*parsed);
    ++filled;
  }
  if (filled != texts.size()) {
    return invalid_response(name(), "expected " + std::to_string(texts.size()) +
                                        " embeddings, got " + std::to_string(filled));
  }
  if (auto status = check_batch(vectors, texts.size(), options_.dimensions, name()); !status.ok()) {
    return BatchResult::failure(status.code(), status.error());
  }
  return BatchResult::success(std::move(vectors));
}

} // namespace nexarag::embedding

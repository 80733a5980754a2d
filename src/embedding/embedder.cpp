#include "nexarag/embedding/embedder.hpp"

#include "nexarag/common/fs.hpp"
#include "nexarag/embedding/local_embedder.hpp"
#include "nexarag/embedding/reliable_embedder.hpp"
#include "nexarag/embedding/remote_embedder.hpp"

namespace nexarag::embedding {

common::Status check_dimensions(const Embedding &values, const std::size_t expected,
                                const std::string_view source) {
  if (values.size() == expected) {
    return common::Status::success();
  }
  return common::Status::error(common::ErrorCode::IndexIncompatible,
                               std::string(source) + " produced a " +
                                   std::to_string(values.size()) +
                                   "-dimensional vector; the index expects " +
                                   std::to_string(expected) +
                                   ". Rebuild the index with a matching embedding model.");
}

common::Result<std::unique_ptr<IEmbedder>>
create_embedder(const config::EmbeddingConfig &config,
                const config::ProviderConfig &provider_config,
                std::shared_ptr<providers::HttpClient> http_client) {
  using FactoryResult = common::Result<std::unique_ptr<IEmbedder>>;
  const std::string provider = common::to_lower(common::trim(config.provider));

  if (provider == "local") {
    return FactoryResult::success(std::make_unique<LocalEmbedder>(config.dimensions));
  }

  RemoteEmbedderOptions options{.base_url = config.base_url,
                                .model = config.model,
                                .api_key = config.api_key,
                                .dimensions = config.dimensions,
                                .batch_size = config.batch_size,
                                .timeout_ms = config.timeout_ms};
  std::unique_ptr<IEmbedder> remote;
  if (provider == "ollama") {
    if (options.base_url.empty()) {
      options.base_url = provider_config.ollama.base_url;
    }
    remote = std::make_unique<OllamaEmbedder>(std::move(options), std::move(http_client));
  } else if (provider == "openai") {
    if (options.base_url.empty()) {
      options.base_url = provider_config.cloud.base_url;
    }
    if (options.api_key.empty()) {
      options.api_key = provider_config.cloud.api_key;
    }
    remote = std::make_unique<OpenAiEmbedder>(std::move(options), std::move(http_client));
  } else {
    return FactoryResult::failure(common::ErrorCode::Configuration,
                                  "Unknown embedding provider: " + config.provider);
  }

  return FactoryResult::success(std::make_unique<ReliableEmbedder>(
      std::move(remote), config.max_retries, config.retry_backoff_ms));
}

} // namespace nexarag::embedding

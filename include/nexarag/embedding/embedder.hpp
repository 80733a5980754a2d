#pragma once

#include "nexarag/common/result.hpp"
#include "nexarag/config/schema.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace nexarag::providers {
class HttpClient;
}

namespace nexarag::embedding {

using Embedding = std::vector<float>;
using EmbeddingResult = common::Result<Embedding>;
using BatchResult = common::Result<std::vector<Embedding>>;

class IEmbedder {
public:
  virtual ~IEmbedder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual EmbeddingResult embed(std::string_view text) = 0;
  [[nodiscard]] virtual BatchResult embed_batch(const std::vector<std::string> &texts) = 0;
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
};

[[nodiscard]] common::Status check_dimensions(const Embedding &values, std::size_t expected,
                                              std::string_view source);

[[nodiscard]] common::Result<std::unique_ptr<IEmbedder>>
create_embedder(const config::EmbeddingConfig &config,
                const config::ProviderConfig &provider_config,
                std::shared_ptr<providers::HttpClient> http_client);

} // namespace nexarag::embedding

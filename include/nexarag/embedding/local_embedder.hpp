#pragma once

#include "nexarag/embedding/embedder.hpp"

namespace nexarag::embedding {

class LocalEmbedder final : public IEmbedder {
public:
  explicit LocalEmbedder(std::size_t dimensions = 384);

  [[nodiscard]] std::string_view name() const override { return "local"; }
  [[nodiscard]] EmbeddingResult embed(std::string_view text) override;
  [[nodiscard]] BatchResult embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }

private:
  std::size_t dimensions_;
};

} // namespace nexarag::embedding

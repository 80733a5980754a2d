#pragma once

#include "nexarag/embedding/embedder.hpp"

#include <cstdint>

namespace nexarag::embedding {

class ReliableEmbedder final : public IEmbedder {
public:
  ReliableEmbedder(std::unique_ptr<IEmbedder> inner, std::uint32_t max_retries,
                   std::uint64_t backoff_ms);

  [[nodiscard]] std::string_view name() const override { return inner_->name(); }
  [[nodiscard]] EmbeddingResult embed(std::string_view text) override;
  [[nodiscard]] BatchResult embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override { return inner_->dimensions(); }

private:
  template <typename T, typename Fn> common::Result<T> with_retry(Fn &&fn);

  std::unique_ptr<IEmbedder> inner_;
  std::uint32_t max_retries_;
  std::uint64_t backoff_ms_;
};

} // namespace nexarag::embedding

#include "nexarag/embedding/reliable_embedder.hpp"

#include "nexarag/common/time.hpp"

#include <chrono>
#include <thread>

namespace nexarag::embedding {

ReliableEmbedder::ReliableEmbedder(std::unique_ptr<IEmbedder> inner,
                                   const std::uint32_t max_retries, const std::uint64_t backoff_ms)
    : inner_(std::move(inner)), max_retries_(max_retries), backoff_ms_(backoff_ms) {}

template <typename T, typename Fn> common::Result<T> ReliableEmbedder::with_retry(Fn &&fn) {
  for (std::uint32_t attempt = 0;; ++attempt) {
    auto result = fn();
    if (result.ok()) {
      return result;
    }
    const auto code = result.code();
    if (code == common::ErrorCode::IndexIncompatible ||
        code == common::ErrorCode::Configuration) {
      return result;
    }
    if (!common::is_retryable(code) || attempt >= max_retries_) {
      return common::Result<T>::failure(common::ErrorCode::EmbeddingUnavailable,
                                        "embedding backend '" + std::string(inner_->name()) +
                                            "' unavailable after " + std::to_string(attempt + 1) +
                                            " attempt(s): " + result.error());
    }
    std::this_thread::sleep_for(
        std::chrono::milliseconds(common::backoff_delay_ms(backoff_ms_, attempt)));
  }
}

EmbeddingResult ReliableEmbedder::embed(const std::string_view text) {
  return with_retry<Embedding>([&] { return inner_->embed(text); });
}

BatchResult ReliableEmbedder::embed_batch(const std::vector<std::string> &texts) {
  return with_retry<std::vector<Embedding>>([&] { return inner_->embed_batch(texts); });
}

} // namespace nexarag::embedding

#include "nexarag/embedding/local_embedder.hpp"

#include "nexarag/common/hash.hpp"

#include <cctype>
#include <cmath>

namespace nexarag::embedding {

namespace {

bool is_token_byte(unsigned char c) { return std::isalnum(c) != 0 || c >= 0x80; }

void normalize(Embedding &values) {
  double norm = 0.0;
  for (const float v : values) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  norm = std::sqrt(norm);
  if (norm < 1e-12) {
    return;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
}

} // namespace

LocalEmbedder::LocalEmbedder(const std::size_t dimensions)
    : dimensions_(dimensions == 0 ? 384 : dimensions) {}

EmbeddingResult LocalEmbedder::embed(const std::string_view text) {
  Embedding values(dimensions_, 0.0F);
  std::string token;
  const auto flush = [&] {
    if (token.empty()) {
      return;
    }
    const std::uint64_t hash = common::fnv1a64(token);
    const float sign = (hash >> 63U) != 0 ? -1.0F : 1.0F;
    values[hash % dimensions_] += sign;
    token.clear();
  };

  for (const char ch : text) {
    const auto c = static_cast<unsigned char>(ch);
    if (is_token_byte(c)) {
      token.push_back(static_cast<char>(std::tolower(c)));
    } else {
      flush();
    }
  }
  flush();

  normalize(values);
  return EmbeddingResult::success(std::move(values));
}

BatchResult LocalEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<Embedding> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto emb = embed(text);
    if (!emb.ok()) {
      return emb.forward_error<std::vector<Embedding>>();
    }
    out.push_back(std::move(emb.value()));
  }
  return BatchResult::success(std::move(out));
}

} // namespace nexarag::embedding

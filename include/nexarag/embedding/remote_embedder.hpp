#pragma once

#include "nexarag/embedding/embedder.hpp"
#include "nexarag/providers/http.hpp"

namespace nexarag::embedding {

struct RemoteEmbedderOptions {
  std::string base_url;
  std::string model;
  std::string api_key;
  std::size_t dimensions = 0;
  std::size_t batch_size = 32;
  std::uint64_t timeout_ms = 30'000;
};

class OllamaEmbedder final : public IEmbedder {
public:
  OllamaEmbedder(RemoteEmbedderOptions options, std::shared_ptr<providers::HttpClient> http_client);

  [[nodiscard]] std::string_view name() const override { return "ollama"; }
  [[nodiscard]] EmbeddingResult embed(std::string_view text) override;
  [[nodiscard]] BatchResult embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override { return options_.dimensions; }

private:
  [[nodiscard]] BatchResult embed_chunk(const std::vector<std::string> &texts);

  RemoteEmbedderOptions options_;
  std::shared_ptr<providers::HttpClient> http_client_;
};

class OpenAiEmbedder final : public IEmbedder {
public:
  OpenAiEmbedder(RemoteEmbedderOptions options, std::shared_ptr<providers::HttpClient> http_client);

  [[nodiscard]] std::string_view name() const override { return "openai"; }
  [[nodiscard]] EmbeddingResult embed(std::string_view text) override;
  [[nodiscard]] BatchResult embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override { return options_.dimensions; }

private:
  [[nodiscard]] BatchResult embed_chunk(const std::vector<std::string> &texts);

  RemoteEmbedderOptions options_;
  std::shared_ptr<providers::HttpClient> http_client_;
};

} // namespace nexarag::embedding

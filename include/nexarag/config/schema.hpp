#pragma once

#include <cstdint>
#include <string>

namespace nexarag::config {

struct OllamaConfig {
  std::string base_url = "http://localhost:11434";
  std::string model = "mistral";
  bool use_chat_api = true;
};

struct CloudConfig {
  std::string api_key;
  std::string base_url = "https://api.openai.com/v1";
  std::string model = "gpt-4";
};

struct GenerationConfig {
  double temperature = 0.2;
  double top_p = 0.9;
  std::uint32_t max_tokens = 512;
  std::uint64_t timeout_ms = 60'000;
  std::uint32_t max_retries = 1;
  std::uint64_t retry_backoff_ms = 500;
};

struct ProviderConfig {
  std::string active = "ollama";
  OllamaConfig ollama;
  CloudConfig cloud;
  GenerationConfig generation;
};

struct EmbeddingConfig {
  std::string provider = "local";
  std::string model = "all-minilm";
  std::size_t dimensions = 384;
  std::size_t batch_size = 32;
  std::string base_url;
  std::string api_key;
  std::uint64_t timeout_ms = 30'000;
  std::uint32_t max_retries = 1;
  std::uint64_t retry_backoff_ms = 250;
};

struct IndexConfig {
  std::string backend = "flat";
  std::string qdrant_url = "http://localhost:6333";
  std::string qdrant_api_key;
  std::string qdrant_collection = "nexa_support";
  std::uint64_t timeout_ms = 10'000;
};

struct RagConfig {
  std::size_t chunk_size = 400;
  std::size_t chunk_overlap = 80;
  std::size_t top_k = 4;
  double similarity_threshold = 0.35;
  std::size_t max_context_chars = 6'000;
  std::string system_prompt_path;
  std::string rag_prompt_path;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::string data_dir = "~/.nexarag/data";
  ProviderConfig provider;
  EmbeddingConfig embedding;
  IndexConfig index;
  RagConfig rag;
  ObservabilityConfig observability;
};

} // namespace nexarag::config

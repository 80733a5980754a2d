#pragma once

#include "nexarag/common/result.hpp"
#include "nexarag/config/schema.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace nexarag::config {

struct ProviderSnapshot {
  std::uint64_t version = 0;
  ProviderConfig config;
};

using ProviderSnapshotPtr = std::shared_ptr<const ProviderSnapshot>;

struct ProviderConfigUpdate {
  std::optional<std::string> active;
  std::optional<std::string> ollama_base_url;
  std::optional<std::string> ollama_model;
  std::optional<bool> ollama_use_chat_api;
  std::optional<std::string> cloud_api_key;
  std::optional<std::string> cloud_base_url;
  std::optional<std::string> cloud_model;
  std::optional<double> temperature;
  std::optional<double> top_p;
  std::optional<std::uint32_t> max_tokens;
  std::optional<std::uint64_t> timeout_ms;
  std::optional<std::uint32_t> max_retries;
  std::optional<std::uint64_t> retry_backoff_ms;
};

[[nodiscard]] ProviderConfig merge_provider_config(ProviderConfig base,
                                                   const ProviderConfigUpdate &update);

class ProviderConfigStore {
public:
  using PersistFn = std::function<common::Status(const ProviderConfig &)>;

  explicit ProviderConfigStore(ProviderConfig initial, PersistFn persist = nullptr);

  [[nodiscard]] ProviderSnapshotPtr get_provider_config() const;

  [[nodiscard]] common::Result<ProviderSnapshotPtr>
  set_provider_config(const ProviderConfigUpdate &update);

private:
  mutable std::mutex swap_mutex_;
  std::mutex write_mutex_;
  ProviderSnapshotPtr current_;
  PersistFn persist_;
};

} // namespace nexarag::config

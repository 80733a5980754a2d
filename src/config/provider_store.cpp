#include "nexarag/config/provider_store.hpp"

#include "nexarag/common/fs.hpp"
#include "nexarag/config/config.hpp"

namespace nexarag::config {

namespace {

template <typename T> void assign_if(T &target, const std::optional<T> &value) {
  if (value.has_value()) {
    target = *value;
  }
}

} // namespace

ProviderConfig merge_provider_config(ProviderConfig base, const ProviderConfigUpdate &update) {
  if (update.active.has_value()) {
    base.active = common::to_lower(common::trim(*update.active));
  }
  assign_if(base.ollama.base_url, update.ollama_base_url);
  assign_if(base.ollama.model, update.ollama_model);
  assign_if(base.ollama.use_chat_api, update.ollama_use_chat_api);
  assign_if(base.cloud.api_key, update.cloud_api_key);
  assign_if(base.cloud.base_url, update.cloud_base_url);
  assign_if(base.cloud.model, update.cloud_model);
  assign_if(base.generation.temperature, update.temperature);
  assign_if(base.generation.top_p, update.top_p);
  assign_if(base.generation.max_tokens, update.max_tokens);
  assign_if(base.generation.timeout_ms, update.timeout_ms);
  assign_if(base.generation.max_retries, update.max_retries);
  assign_if(base.generation.retry_backoff_ms, update.retry_backoff_ms);
  return base;
}

ProviderConfigStore::ProviderConfigStore(ProviderConfig initial, PersistFn persist)
    : current_(std::make_shared<const ProviderSnapshot>(ProviderSnapshot{1, std::move(initial)})),
      persist_(std::move(persist)) {}

ProviderSnapshotPtr ProviderConfigStore::get_provider_config() const {
  std::lock_guard<std::mutex> lock(swap_mutex_);
  return current_;
}

common::Result<ProviderSnapshotPtr>
ProviderConfigStore::set_provider_config(const ProviderConfigUpdate &update) {
  // Serializes read-merge-publish so concurrent updates never lose fields.
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  const auto base = get_provider_config();

  ProviderConfig merged = merge_provider_config(base->config, update);
  if (auto valid = validate_provider_config(merged); !valid.ok()) {
    return common::Result<ProviderSnapshotPtr>::failure(valid.code(), valid.error());
  }
  if (persist_) {
    if (auto saved = persist_(merged); !saved.ok()) {
      return common::Result<ProviderSnapshotPtr>::failure(saved.code(), saved.error());
    }
  }

  auto next = std::make_shared<const ProviderSnapshot>(
      ProviderSnapshot{base->version + 1, std::move(merged)});
  {
    std::lock_guard<std::mutex> lock(swap_mutex_);
    current_ = next;
  }
  return common::Result<ProviderSnapshotPtr>::success(std::move(next));
}

} // namespace nexarag::config

#include "nexarag/providers/router.hpp"

#include "nexarag/common/fs.hpp"
#include "nexarag/providers/factory.hpp"

namespace nexarag::providers {

ProviderRouter::ProviderRouter(std::shared_ptr<config::ProviderConfigStore> store,
                               std::shared_ptr<HttpClient> http_client)
    : ProviderRouter(std::move(store),
                     [http_client = std::move(http_client)](
                         const config::ProviderSnapshot &snapshot) {
                       return create_provider(snapshot.config, snapshot.version, http_client);
                     }) {}

ProviderRouter::ProviderRouter(std::shared_ptr<config::ProviderConfigStore> store,
                               BackendFactory factory)
    : store_(std::move(store)), factory_(std::move(factory)) {}

config::ProviderSnapshotPtr ProviderRouter::snapshot() const {
  return store_->get_provider_config();
}

common::Result<std::shared_ptr<Provider>>
ProviderRouter::backend_for(const config::ProviderSnapshotPtr &snapshot) {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  if (cached_backend_ != nullptr && cached_version_ == snapshot->version) {
    return common::Result<std::shared_ptr<Provider>>::success(cached_backend_);
  }
  auto backend = factory_(*snapshot);
  if (!backend.ok()) {
    return backend;
  }
  // Never replace a newer cached backend with an older one.
  if (cached_backend_ == nullptr || snapshot->version > cached_version_) {
    cached_backend_ = backend.value();
    cached_version_ = snapshot->version;
  }
  return backend;
}

common::Result<GenerationResult> ProviderRouter::generate(const GenerationRequest &request) {
  const auto current = snapshot();
  auto backend = backend_for(current);
  if (!backend.ok()) {
    return backend.forward_error<GenerationResult>();
  }
  auto text = backend.value()->generate(request);
  if (!text.ok()) {
    return text.forward_error<GenerationResult>();
  }
  return common::Result<GenerationResult>::success(
      GenerationResult{.text = std::move(text.value()),
                       .provider = backend.value()->name(),
                       .model = backend.value()->model(),
                       .config_version = current->version});
}

ProviderStatus ProviderRouter::status() {
  const auto current = snapshot();
  auto backend = backend_for(current);
  if (!backend.ok()) {
    return ProviderStatus{.provider = current->config.active,
                          .model = "",
                          .base_url = "",
                          .ready = false,
                          .models_available = {},
                          .detail = backend.error()};
  }
  return backend.value()->status();
}

common::Result<std::vector<std::string>> ProviderRouter::list_models() {
  auto backend = backend_for(snapshot());
  if (!backend.ok()) {
    return backend.forward_error<std::vector<std::string>>();
  }
  return backend.value()->list_models();
}

common::Result<config::ProviderSnapshotPtr>
ProviderRouter::switch_provider(const std::string &provider) {
  config::ProviderConfigUpdate update;
  update.active = common::to_lower(common::trim(provider));
  return store_->set_provider_config(update);
}

common::Result<config::ProviderSnapshotPtr> ProviderRouter::switch_model(const std::string &model) {
  const std::string trimmed = common::trim(model);
  if (trimmed.empty()) {
    return common::Result<config::ProviderSnapshotPtr>::failure(common::ErrorCode::Configuration,
                                                                "model name must not be empty");
  }
  config::ProviderConfigUpdate update;
  if (snapshot()->config.active == "cloud") {
    update.cloud_model = trimmed;
  } else {
    update.ollama_model = trimmed;
  }
  return store_->set_provider_config(update);
}

} // namespace nexarag::providers

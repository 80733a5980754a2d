#pragma once

#include "nexarag/config/provider_store.hpp"
#include "nexarag/providers/http.hpp"
#include "nexarag/providers/traits.hpp"

#include <functional>
#include <memory>
#include <mutex>

namespace nexarag::providers {

struct GenerationResult {
  std::string text;
  std::string provider;
  std::string model;
  std::uint64_t config_version = 0;
};

// Each call captures one provider snapshot; a switch affects later calls only.
class ProviderRouter {
public:
  using BackendFactory = std::function<common::Result<std::shared_ptr<Provider>>(
      const config::ProviderSnapshot &snapshot)>;

  ProviderRouter(std::shared_ptr<config::ProviderConfigStore> store,
                 std::shared_ptr<HttpClient> http_client);
  ProviderRouter(std::shared_ptr<config::ProviderConfigStore> store, BackendFactory factory);

  [[nodiscard]] common::Result<GenerationResult> generate(const GenerationRequest &request);
  [[nodiscard]] ProviderStatus status();
  [[nodiscard]] common::Result<std::vector<std::string>> list_models();

  [[nodiscard]] common::Result<config::ProviderSnapshotPtr>
  switch_provider(const std::string &provider);
  [[nodiscard]] common::Result<config::ProviderSnapshotPtr> switch_model(const std::string &model);

  [[nodiscard]] config::ProviderSnapshotPtr snapshot() const;

private:
  [[nodiscard]] common::Result<std::shared_ptr<Provider>>
  backend_for(const config::ProviderSnapshotPtr &snapshot);

  std::shared_ptr<config::ProviderConfigStore> store_;
  BackendFactory factory_;

  std::mutex cache_mutex_;
  std::uint64_t cached_version_ = 0;
  std::shared_ptr<Provider> cached_backend_;
};

} // namespace nexarag::providers

#include "nexarag/providers/factory.hpp"

#include "nexarag/common/fs.hpp"
#include "nexarag/providers/compatible.hpp"
#include "nexarag/providers/ollama.hpp"
#include "nexarag/providers/reliable.hpp"

namespace nexarag::providers {

GenerationParams params_from(const config::GenerationConfig &config) {
  return GenerationParams{.temperature = config.temperature,
                          .top_p = config.top_p,
                          .max_tokens = config.max_tokens,
                          .timeout_ms = config.timeout_ms};
}

common::Result<std::shared_ptr<Provider>>
create_provider(const config::ProviderConfig &config, const std::uint64_t config_version,
                std::shared_ptr<HttpClient> http_client) {
  using ProviderResult = common::Result<std::shared_ptr<Provider>>;
  const std::string active = common::to_lower(common::trim(config.active));
  const auto params = params_from(config.generation);

  std::shared_ptr<Provider> inner;
  if (active == "ollama") {
    inner = std::make_shared<OllamaProvider>(config.ollama, params, std::move(http_client));
  } else if (active == "cloud") {
    inner = std::make_shared<CompatibleProvider>(config.cloud, params, std::move(http_client));
  } else {
    return ProviderResult::failure(common::ErrorCode::Configuration,
                                   "unknown provider: " + config.active);
  }
  return ProviderResult::success(std::make_shared<ReliableProvider>(
      std::move(inner), config.generation.max_retries, config.generation.retry_backoff_ms,
      config_version));
}

} // namespace nexarag::providers

#pragma once

#include "nexarag/providers/http.hpp"
#include "nexarag/providers/traits.hpp"

#include <memory>

namespace nexarag::providers {

class OllamaProvider final : public Provider {
public:
  OllamaProvider(config::OllamaConfig config, GenerationParams params,
                 std::shared_ptr<HttpClient> http_client);

  [[nodiscard]] common::Result<std::string> generate(const GenerationRequest &request) override;
  [[nodiscard]] ProviderStatus status() override;
  [[nodiscard]] common::Result<std::vector<std::string>> list_models() override;
  [[nodiscard]] std::string name() const override { return "ollama"; }
  [[nodiscard]] std::string model() const override { return config_.model; }

private:
  [[nodiscard]] std::string options_json(const GenerationRequest &request) const;

  config::OllamaConfig config_;
  GenerationParams params_;
  std::shared_ptr<HttpClient> http_client_;
};

} // namespace nexarag::providers

#pragma once

#include "nexarag/providers/http.hpp"
#include "nexarag/providers/traits.hpp"

#include <memory>

namespace nexarag::providers {

class CompatibleProvider final : public Provider {
public:
  CompatibleProvider(config::CloudConfig config, GenerationParams params,
                     std::shared_ptr<HttpClient> http_client);

  [[nodiscard]] common::Result<std::string> generate(const GenerationRequest &request) override;
  [[nodiscard]] ProviderStatus status() override;
  [[nodiscard]] common::Result<std::vector<std::string>> list_models() override;
  [[nodiscard]] std::string name() const override { return "cloud"; }
  [[nodiscard]] std::string model() const override { return config_.model; }

private:
  [[nodiscard]] std::string build_body(const GenerationRequest &request) const;
  [[nodiscard]] HttpHeaders auth_headers() const;

  config::CloudConfig config_;
  GenerationParams params_;
  std::shared_ptr<HttpClient> http_client_;
};

[[nodiscard]] common::Result<std::string> parse_openai_content(const std::string &response);

} // namespace nexarag::providers

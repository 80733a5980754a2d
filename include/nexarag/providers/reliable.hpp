#pragma once

#include "nexarag/providers/traits.hpp"

#include <memory>

namespace nexarag::providers {

class ReliableProvider final : public Provider {
public:
  ReliableProvider(std::shared_ptr<Provider> inner, std::uint32_t max_retries,
                   std::uint64_t backoff_ms, std::uint64_t config_version = 0);

  [[nodiscard]] common::Result<std::string> generate(const GenerationRequest &request) override;
  [[nodiscard]] ProviderStatus status() override;
  [[nodiscard]] common::Result<std::vector<std::string>> list_models() override;
  [[nodiscard]] std::string name() const override;
  [[nodiscard]] std::string model() const override;

private:
  std::shared_ptr<Provider> inner_;
  std::uint32_t max_retries_;
  std::uint64_t backoff_ms_;
  std::uint64_t config_version_;
};

} // namespace nexarag::providers

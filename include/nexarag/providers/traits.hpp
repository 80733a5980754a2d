#pragma once

#include "nexarag/common/cancel.hpp"
#include "nexarag/common/result.hpp"
#include "nexarag/config/schema.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nexarag::providers {

struct GenerationParams {
  double temperature = 0.2;
  double top_p = 0.9;
  std::uint32_t max_tokens = 512;
  std::uint64_t timeout_ms = 60'000;
};

[[nodiscard]] GenerationParams params_from(const config::GenerationConfig &config);

struct GenerationRequest {
  std::string system_prompt;
  std::string prompt;
  std::optional<double> temperature;
  std::optional<std::uint32_t> max_tokens;
  const common::CancellationToken *cancel = nullptr;
};

struct ProviderStatus {
  std::string provider;
  std::string model;
  std::string base_url;
  bool ready = false;
  std::vector<std::string> models_available;
  std::string detail;
};

class Provider {
public:
  virtual ~Provider() = default;

  [[nodiscard]] virtual common::Result<std::string> generate(const GenerationRequest &request) = 0;
  [[nodiscard]] virtual ProviderStatus status() = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::string>> list_models() = 0;
  [[nodiscard]] virtual std::string name() const = 0;
  [[nodiscard]] virtual std::string model() const = 0;
};

} // namespace nexarag::providers

#pragma once

#include "nexarag/common/result.hpp"
#include "nexarag/config/schema.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace nexarag::config {

inline constexpr std::uint32_t kMaxRetries = 10;

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] common::Result<std::filesystem::path> data_dir(const Config &config);
void set_config_path_override(std::optional<std::filesystem::path> path);
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);
[[nodiscard]] common::Status save_config(const Config &config);
[[nodiscard]] std::string serialize_config(const Config &config);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);
[[nodiscard]] common::Status validate_provider_config(const ProviderConfig &provider);

void apply_env_overrides(Config &config);

} // namespace nexarag::config

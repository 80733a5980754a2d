#pragma once

#include "nexarag/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace nexarag::common {

struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] std::uint32_t get_u32(const std::string &key, std::uint32_t fallback) const;
  [[nodiscard]] std::size_t get_size(const std::string &key, std::size_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace nexarag::common

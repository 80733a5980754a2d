#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace nexarag::common {

[[nodiscard]] std::string sha256_hex(std::string_view data);

[[nodiscard]] constexpr std::uint64_t fnv1a64(std::string_view data) {
  std::uint64_t hash = 0xcbf29ce484222325ULL;
  for (const char ch : data) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= 0x100000001b3ULL;
  }
  return hash;
}

} // namespace nexarag::common

#pragma once

#include <cstdint>
#include <string>

namespace nexarag::common {

[[nodiscard]] std::string now_rfc3339();

[[nodiscard]] std::uint64_t now_unix_ms();

inline constexpr std::uint64_t kMaxBackoffMs = 30'000;

[[nodiscard]] std::uint64_t backoff_delay_ms(std::uint64_t base_ms, std::uint32_t attempt);

} // namespace nexarag::common

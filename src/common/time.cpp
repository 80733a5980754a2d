#include "nexarag/common/time.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace nexarag::common {

std::string now_rfc3339() {
  const auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::uint64_t now_unix_ms() {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::system_clock::now().time_since_epoch())
                                        .count());
}

std::uint64_t backoff_delay_ms(const std::uint64_t base_ms, const std::uint32_t attempt) {
  std::uint64_t delay = std::min(base_ms, kMaxBackoffMs);
  for (std::uint32_t i = 0; i < attempt && delay < kMaxBackoffMs; ++i) {
    delay *= 2;
  }
  return std::min(delay, kMaxBackoffMs);
}

} // namespace nexarag::common

#pragma once

#include <chrono>
#include <cstdint>

namespace stt_integrity::core {

inline std::uint64_t unix_timestamp_now_ns() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

inline std::int64_t unix_timestamp_now_ms() {
  return static_cast<std::int64_t>(unix_timestamp_now_ns() / 1'000'000ULL);
}

}  // namespace stt_integrity::core

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace stt_integrity::model {

// Client-declared description of one audio frame.
struct Metadata {
  std::uint32_t sample_rate{0};
  std::optional<std::uint32_t> data_length{};
  std::optional<std::uint32_t> checksum{};
  std::optional<std::int64_t> timestamp_ms{};
  bool verification_requested{false};
};

// Payload holds signed 16-bit little-endian PCM, always an even byte count.
struct DecodedFrame {
  Metadata metadata{};
  std::vector<std::uint8_t> payload{};
};

struct VerificationVerdict {
  std::uint64_t length_expected{0};
  std::uint64_t length_actual{0};
  std::uint32_t checksum_expected{0};
  std::uint32_t checksum_actual{0};
  bool ok{false};
};

enum class Action : std::uint8_t {
  ACCEPT = 0,
  ACCEPT_WITH_WARNING = 1,
  REJECT = 2,
};

enum class ConnectionPhase : std::uint8_t {
  ACTIVE = 0,
  REJECTED = 1,
  DISCONNECTED = 2,
};

struct ConnectionStats {
  std::uint64_t frames_received{0};
  std::uint64_t frames_accepted{0};
  std::uint64_t frames_verified{0};
  std::uint64_t verification_failures{0};
  std::uint64_t decode_errors{0};
  bool rejected{false};
};

// Server-wide counters, folded in as connections end.
struct IntegrityTotals {
  std::uint64_t connections_closed{0};
  std::uint64_t connections_rejected{0};
  std::uint64_t frames_received{0};
  std::uint64_t frames_accepted{0};
  std::uint64_t frames_verified{0};
  std::uint64_t verification_failures{0};
  std::uint64_t decode_errors{0};
  float redis_latency_ms{0.0F};
};

inline void accumulate(IntegrityTotals& totals, const ConnectionStats& stats) noexcept {
  totals.connections_closed += 1;
  totals.connections_rejected += stats.rejected ? 1 : 0;
  totals.frames_received += stats.frames_received;
  totals.frames_accepted += stats.frames_accepted;
  totals.frames_verified += stats.frames_verified;
  totals.verification_failures += stats.verification_failures;
  totals.decode_errors += stats.decode_errors;
}

inline const char* to_string(const Action action) {
  switch (action) {
    case Action::ACCEPT:
      return "accept";
    case Action::ACCEPT_WITH_WARNING:
      return "accept_with_warning";
    case Action::REJECT:
      return "reject";
  }
  return "unknown";
}

}  // namespace stt_integrity::model

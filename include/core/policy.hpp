#pragma once

#include <cstdint>
#include <memory>

namespace stt_integrity::core {

// Process-wide verification policy. Built once at startup and shared
// read-only by every connection.
struct PolicyConfig {
  bool verify_enabled{false};
  bool reject_enabled{false};
  // Failures tolerated before rejection; 0 rejects on the first failure.
  std::uint32_t corruption_threshold{0};
  bool extended_logging{false};
  bool close_on_decode_error{false};
};

using PolicyPtr = std::shared_ptr<const PolicyConfig>;

inline PolicyPtr make_policy(const PolicyConfig& policy) {
  return std::make_shared<const PolicyConfig>(policy);
}

}  // namespace stt_integrity::core

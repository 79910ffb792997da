#include "integrity/verifier.hpp"

namespace stt_integrity::integrity {

std::uint32_t compute_checksum(const std::uint8_t* data, const std::size_t size) noexcept {
  std::int64_t sum = 0;
  for (std::size_t i = 0; i + 1 < size; i += 2) {
    const auto raw = static_cast<std::uint16_t>(data[i] | (static_cast<std::uint16_t>(data[i + 1]) << 8U));
    sum += static_cast<std::int16_t>(raw);
  }
  return static_cast<std::uint32_t>(sum);
}

std::uint32_t compute_checksum(const std::vector<std::uint8_t>& payload) noexcept {
  return compute_checksum(payload.data(), payload.size());
}

std::uint32_t compute_checksum(const std::vector<std::int16_t>& samples) noexcept {
  std::int64_t sum = 0;
  for (const auto sample : samples) {
    sum += sample;
  }
  return static_cast<std::uint32_t>(sum);
}

model::VerificationVerdict verify(const model::Metadata& metadata, const std::vector<std::uint8_t>& payload) {
  model::VerificationVerdict verdict{};
  verdict.length_expected = metadata.data_length.value_or(0);
  verdict.length_actual = payload.size() / 2;
  verdict.checksum_expected = metadata.checksum.value_or(0);
  verdict.checksum_actual = compute_checksum(payload);
  verdict.ok = metadata.data_length.has_value() && metadata.checksum.has_value() &&
               verdict.length_actual == verdict.length_expected &&
               verdict.checksum_actual == verdict.checksum_expected;
  return verdict;
}

std::optional<model::VerificationVerdict> verify_if_requested(const model::Metadata& metadata,
                                                              const std::vector<std::uint8_t>& payload,
                                                              const core::PolicyConfig& policy) {
  if (!policy.verify_enabled || !metadata.verification_requested) {
    return std::nullopt;
  }
  return verify(metadata, payload);
}

}  // namespace stt_integrity::integrity

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "core/policy.hpp"
#include "model/frame.hpp"

namespace stt_integrity::integrity {

// Sum of signed 16-bit LE samples, accumulated in 64 bits and reduced mod 2^32.
// A trailing odd byte is ignored.
std::uint32_t compute_checksum(const std::uint8_t* data, std::size_t size) noexcept;
std::uint32_t compute_checksum(const std::vector<std::uint8_t>& payload) noexcept;
std::uint32_t compute_checksum(const std::vector<std::int16_t>& samples) noexcept;

model::VerificationVerdict verify(const model::Metadata& metadata, const std::vector<std::uint8_t>& payload);

// No verdict unless the policy enables verification and the frame asks for it.
std::optional<model::VerificationVerdict> verify_if_requested(const model::Metadata& metadata,
                                                              const std::vector<std::uint8_t>& payload,
                                                              const core::PolicyConfig& policy);

}  // namespace stt_integrity::integrity

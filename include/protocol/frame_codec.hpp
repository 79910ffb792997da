#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/frame.hpp"

namespace stt_integrity::protocol {

// Wire layout: [u32 LE metadata length][UTF-8 JSON metadata][s16 LE samples].
constexpr std::size_t kLengthPrefixBytes = 4;

enum class DecodeError : std::uint8_t {
  TRUNCATED = 0,
  MALFORMED_METADATA = 1,
  MISALIGNED_PAYLOAD = 2,
};

const char* to_string(DecodeError error);

class FrameDecodeError : public std::runtime_error {
 public:
  FrameDecodeError(DecodeError code, const std::string& message);

  [[nodiscard]] DecodeError code() const noexcept { return code_; }

 private:
  DecodeError code_;
};

// Throws FrameDecodeError when the buffer cannot be parsed.
model::DecodedFrame decode_frame(const std::uint8_t* data, std::size_t size);
model::DecodedFrame decode_frame(const std::vector<std::uint8_t>& buffer);

model::Metadata parse_metadata(const nlohmann::json& document);
nlohmann::json metadata_to_json(const model::Metadata& metadata);

// Client-side framing.
std::vector<std::uint8_t> encode_frame(const model::Metadata& metadata, const std::vector<std::int16_t>& samples);

// Metadata with dataLength and checksum filled from the samples.
model::Metadata make_metadata(std::uint32_t sample_rate, const std::vector<std::int16_t>& samples,
                              std::int64_t timestamp_ms);

}  // namespace stt_integrity::protocol

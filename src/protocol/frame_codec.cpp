#include "protocol/frame_codec.hpp"

#include <limits>
#include <optional>
#include <string>

#include "integrity/verifier.hpp"

namespace stt_integrity::protocol {
namespace {

constexpr const char* kVerificationRequestedKey = "verificationRequested";
// Older clients flag verified frames with this key instead.
constexpr const char* kLegacyVerificationKey = "server_sent_to_stt";

[[noreturn]] void malformed(const std::string& message) {
  throw FrameDecodeError(DecodeError::MALFORMED_METADATA, message);
}

std::optional<std::uint32_t> read_u32(const nlohmann::json& document, const char* key) {
  const auto it = document.find(key);
  if (it == document.end()) {
    return std::nullopt;
  }
  if (!it->is_number_unsigned()) {
    malformed(std::string(key) + " must be a non-negative integer");
  }
  const auto value = it->get<std::uint64_t>();
  if (value > std::numeric_limits<std::uint32_t>::max()) {
    malformed(std::string(key) + " exceeds uint32 range");
  }
  return static_cast<std::uint32_t>(value);
}

std::optional<std::int64_t> read_i64(const nlohmann::json& document, const char* key) {
  const auto it = document.find(key);
  if (it == document.end()) {
    return std::nullopt;
  }
  if (it->is_number_unsigned()) {
    const auto value = it->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      malformed(std::string(key) + " exceeds int64 range");
    }
    return static_cast<std::int64_t>(value);
  }
  if (!it->is_number_integer()) {
    malformed(std::string(key) + " must be an integer");
  }
  return it->get<std::int64_t>();
}

std::optional<bool> read_bool(const nlohmann::json& document, const char* key) {
  const auto it = document.find(key);
  if (it == document.end()) {
    return std::nullopt;
  }
  if (!it->is_boolean()) {
    malformed(std::string(key) + " must be a boolean");
  }
  return it->get<bool>();
}

void append_u32_le(std::vector<std::uint8_t>& out, const std::uint32_t value) {
  out.push_back(static_cast<std::uint8_t>(value & 0xFFU));
  out.push_back(static_cast<std::uint8_t>((value >> 8U) & 0xFFU));
  out.push_back(static_cast<std::uint8_t>((value >> 16U) & 0xFFU));
  out.push_back(static_cast<std::uint8_t>((value >> 24U) & 0xFFU));
}

}  // namespace

const char* to_string(const DecodeError error) {
  switch (error) {
    case DecodeError::TRUNCATED:
      return "truncated";
    case DecodeError::MALFORMED_METADATA:
      return "malformed_metadata";
    case DecodeError::MISALIGNED_PAYLOAD:
      return "misaligned_payload";
  }
  return "unknown";
}

FrameDecodeError::FrameDecodeError(const DecodeError code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

model::Metadata parse_metadata(const nlohmann::json& document) {
  if (!document.is_object()) {
    malformed("metadata must be a JSON object");
  }

  model::Metadata metadata{};
  const auto sample_rate = read_u32(document, "sampleRate");
  if (!sample_rate.has_value()) {
    malformed("sampleRate is required");
  }
  metadata.sample_rate = *sample_rate;
  metadata.data_length = read_u32(document, "dataLength");
  metadata.checksum = read_u32(document, "checksum");
  metadata.timestamp_ms = read_i64(document, "timestamp");

  auto requested = read_bool(document, kVerificationRequestedKey);
  if (!requested.has_value()) {
    requested = read_bool(document, kLegacyVerificationKey);
  }

  const bool has_fields = metadata.data_length.has_value() && metadata.checksum.has_value();
  if (requested.has_value()) {
    if (*requested && !has_fields) {
      malformed("verification requested without dataLength and checksum");
    }
    metadata.verification_requested = *requested;
  } else {
    metadata.verification_requested = has_fields;
  }

  if (metadata.verification_requested && !metadata.timestamp_ms.has_value()) {
    malformed("timestamp is required when verification is requested");
  }

  return metadata;
}

nlohmann::json metadata_to_json(const model::Metadata& metadata) {
  nlohmann::json document{{"sampleRate", metadata.sample_rate}};
  if (metadata.data_length.has_value()) {
    document["dataLength"] = *metadata.data_length;
  }
  if (metadata.checksum.has_value()) {
    document["checksum"] = *metadata.checksum;
  }
  if (metadata.timestamp_ms.has_value()) {
    document["timestamp"] = *metadata.timestamp_ms;
  }
  document[kVerificationRequestedKey] = metadata.verification_requested;
  return document;
}

model::DecodedFrame decode_frame(const std::uint8_t* data, const std::size_t size) {
  if (size < kLengthPrefixBytes) {
    throw FrameDecodeError(DecodeError::TRUNCATED,
                           "frame shorter than length prefix (" + std::to_string(size) + " bytes)");
  }

  const std::uint32_t metadata_length = static_cast<std::uint32_t>(data[0]) |
                                        (static_cast<std::uint32_t>(data[1]) << 8U) |
                                        (static_cast<std::uint32_t>(data[2]) << 16U) |
                                        (static_cast<std::uint32_t>(data[3]) << 24U);
  const std::size_t remaining = size - kLengthPrefixBytes;
  if (remaining < metadata_length) {
    throw FrameDecodeError(DecodeError::TRUNCATED, "metadata length " + std::to_string(metadata_length) +
                                                       " exceeds remaining " + std::to_string(remaining) +
                                                       " bytes");
  }

  const std::uint8_t* metadata_begin = data + kLengthPrefixBytes;
  const std::uint8_t* metadata_end = metadata_begin + metadata_length;

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(metadata_begin, metadata_end);
  } catch (const nlohmann::json::parse_error& ex) {
    throw FrameDecodeError(DecodeError::MALFORMED_METADATA, std::string("invalid metadata JSON: ") + ex.what());
  }

  model::DecodedFrame frame{};
  frame.metadata = parse_metadata(document);

  const std::size_t payload_size = remaining - metadata_length;
  if ((payload_size % 2U) != 0U) {
    throw FrameDecodeError(DecodeError::MISALIGNED_PAYLOAD,
                           "payload of " + std::to_string(payload_size) + " bytes is not whole 16-bit samples");
  }
  frame.payload.assign(metadata_end, data + size);
  return frame;
}

model::DecodedFrame decode_frame(const std::vector<std::uint8_t>& buffer) {
  return decode_frame(buffer.data(), buffer.size());
}

std::vector<std::uint8_t> encode_frame(const model::Metadata& metadata, const std::vector<std::int16_t>& samples) {
  const std::string metadata_json = metadata_to_json(metadata).dump();

  std::vector<std::uint8_t> out;
  out.reserve(kLengthPrefixBytes + metadata_json.size() + (samples.size() * 2));
  append_u32_le(out, static_cast<std::uint32_t>(metadata_json.size()));
  out.insert(out.end(), metadata_json.begin(), metadata_json.end());
  for (const auto sample : samples) {
    const auto raw = static_cast<std::uint16_t>(sample);
    out.push_back(static_cast<std::uint8_t>(raw & 0xFFU));
    out.push_back(static_cast<std::uint8_t>((raw >> 8U) & 0xFFU));
  }
  return out;
}

model::Metadata make_metadata(const std::uint32_t sample_rate, const std::vector<std::int16_t>& samples,
                              const std::int64_t timestamp_ms) {
  model::Metadata metadata{};
  metadata.sample_rate = sample_rate;
  metadata.data_length = static_cast<std::uint32_t>(samples.size());
  metadata.checksum = integrity::compute_checksum(samples);
  metadata.timestamp_ms = timestamp_ms;
  metadata.verification_requested = true;
  return metadata;
}

}  // namespace stt_integrity::protocol

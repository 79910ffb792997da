#include "client/chunk_builder.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>

#include "protocol/frame_codec.hpp"

namespace stt_integrity::client {
namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kToneAmplitude = 0.3;
constexpr std::uint32_t kChecksumOffset = 12345;
constexpr std::uint32_t kLengthOffset = 100;

}  // namespace

ChunkMode parse_chunk_mode(const std::string& value) {
  if (value == "valid") {
    return ChunkMode::VALID;
  }
  if (value == "wrong_checksum") {
    return ChunkMode::WRONG_CHECKSUM;
  }
  if (value == "wrong_length") {
    return ChunkMode::WRONG_LENGTH;
  }
  if (value == "corrupted_audio") {
    return ChunkMode::CORRUPTED_AUDIO;
  }
  if (value == "no_verify") {
    return ChunkMode::NO_VERIFY;
  }
  throw std::invalid_argument("mode must be valid, wrong_checksum, wrong_length, corrupted_audio, or no_verify");
}

const char* to_string(const ChunkMode mode) {
  switch (mode) {
    case ChunkMode::VALID:
      return "valid";
    case ChunkMode::WRONG_CHECKSUM:
      return "wrong_checksum";
    case ChunkMode::WRONG_LENGTH:
      return "wrong_length";
    case ChunkMode::CORRUPTED_AUDIO:
      return "corrupted_audio";
    case ChunkMode::NO_VERIFY:
      return "no_verify";
  }
  return "unknown";
}

bool expects_rejection(const ChunkMode mode) noexcept {
  return mode == ChunkMode::WRONG_CHECKSUM || mode == ChunkMode::WRONG_LENGTH || mode == ChunkMode::CORRUPTED_AUDIO;
}

std::vector<std::int16_t> generate_tone(const std::uint32_t sample_rate, const int duration_ms,
                                        const double frequency_hz) {
  const auto count = static_cast<std::size_t>(sample_rate) * static_cast<std::size_t>(duration_ms) / 1000U;
  std::vector<std::int16_t> samples(count);
  for (std::size_t i = 0; i < count; ++i) {
    const double t = static_cast<double>(i) / sample_rate;
    samples[i] = static_cast<std::int16_t>(std::sin(2.0 * kPi * frequency_hz * t) * kToneAmplitude * 32767.0);
  }
  return samples;
}

std::vector<std::uint8_t> build_chunk(const ChunkMode mode, const std::uint32_t sample_rate,
                                      const std::vector<std::int16_t>& samples, const std::int64_t timestamp_ms) {
  auto metadata = protocol::make_metadata(sample_rate, samples, timestamp_ms);
  switch (mode) {
    case ChunkMode::WRONG_CHECKSUM:
      metadata.checksum = *metadata.checksum + kChecksumOffset;
      break;
    case ChunkMode::WRONG_LENGTH:
      metadata.data_length = *metadata.data_length + kLengthOffset;
      break;
    case ChunkMode::NO_VERIFY:
      metadata.data_length.reset();
      metadata.checksum.reset();
      metadata.verification_requested = false;
      break;
    case ChunkMode::VALID:
    case ChunkMode::CORRUPTED_AUDIO:
      break;
  }

  auto frame = protocol::encode_frame(metadata, samples);
  if (mode == ChunkMode::CORRUPTED_AUDIO) {
    // Damage the payload after the checksum was computed over the original samples.
    const std::size_t payload_offset = frame.size() - samples.size() * 2;
    const std::size_t begin = std::min(payload_offset + kCorruptedByteBegin, frame.size());
    const std::size_t end = std::min(payload_offset + kCorruptedByteEnd, frame.size());
    std::fill(frame.begin() + static_cast<std::ptrdiff_t>(begin), frame.begin() + static_cast<std::ptrdiff_t>(end),
              std::uint8_t{0});
  }
  return frame;
}

}  // namespace stt_integrity::client

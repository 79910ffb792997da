#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace stt_integrity::client {

enum class ChunkMode : std::uint8_t {
  VALID = 0,
  WRONG_CHECKSUM = 1,
  WRONG_LENGTH = 2,
  CORRUPTED_AUDIO = 3,
  NO_VERIFY = 4,
};

// Payload bytes [100, 110) are zeroed in CORRUPTED_AUDIO chunks.
constexpr std::size_t kCorruptedByteBegin = 100;
constexpr std::size_t kCorruptedByteEnd = 110;

// Throws std::invalid_argument for an unknown mode name.
ChunkMode parse_chunk_mode(const std::string& value);
const char* to_string(ChunkMode mode);

// True when a strict server is expected to reject the chunk.
bool expects_rejection(ChunkMode mode) noexcept;

std::vector<std::int16_t> generate_tone(std::uint32_t sample_rate, int duration_ms, double frequency_hz = 440.0);

// Frames samples the way the streaming clients do, then applies the mode's corruption.
std::vector<std::uint8_t> build_chunk(ChunkMode mode, std::uint32_t sample_rate, const std::vector<std::int16_t>& samples,
                                      std::int64_t timestamp_ms);

}  // namespace stt_integrity::client

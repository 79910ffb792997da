#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <poll.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "client/chunk_builder.hpp"
#include "core/timestamp.hpp"
#include "transport/socket_io.hpp"

namespace {

constexpr std::uint32_t kSampleRate = 16000;
constexpr int kChunkMs = 200;
constexpr int kDefaultIntervalMs = 500;
constexpr int kFinalWaitMs = 1000;

using stt_integrity::client::ChunkMode;

// Reads server notices for up to wait_ms. Returns false once the server has
// closed the connection.
bool drain_responses(const int fd, const int wait_ms, bool& rejected) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(wait_ms);
  while (true) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    if (::poll(&pfd, 1, remaining > 0 ? static_cast<int>(remaining) : 0) <= 0) {
      return true;
    }

    std::vector<std::uint8_t> message;
    std::string err;
    if (!stt_integrity::transport::read_message(fd, message, err)) {
      std::cerr << "[probe] server closed connection" << (err.empty() ? "" : ": " + err) << '\n';
      return false;
    }

    const auto notice = nlohmann::json::parse(message.begin(), message.end(), nullptr, false);
    if (notice.is_discarded()) {
      std::cerr << "[probe] unparseable server message (" << message.size() << " bytes)\n";
      continue;
    }
    if (notice.value("type", "") == "error" && notice.value("error", "") == "data_corruption") {
      rejected = true;
      std::cerr << "[probe] rejected: " << notice.value("message", "") << '\n';
    } else {
      std::cerr << "[probe] server: " << notice.dump() << '\n';
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 4) {
    std::cerr << "usage: stt-integrity-probe <host> <port> <chunks> "
                 "[valid|wrong_checksum|wrong_length|corrupted_audio|no_verify] [interval_ms]\n";
    return 2;
  }

  ChunkMode mode = ChunkMode::VALID;
  std::uint16_t port = 0;
  int chunks = 0;
  int interval_ms = kDefaultIntervalMs;
  try {
    const int parsed_port = std::stoi(argv[2]);
    if (parsed_port <= 0 || parsed_port > 65535) {
      throw std::invalid_argument("port must be in range 1..65535");
    }
    port = static_cast<std::uint16_t>(parsed_port);
    chunks = std::stoi(argv[3]);
    if (argc > 4) {
      mode = stt_integrity::client::parse_chunk_mode(argv[4]);
    }
    if (argc > 5) {
      interval_ms = std::stoi(argv[5]);
      if (interval_ms < 0) {
        throw std::invalid_argument("interval_ms must be greater than or equal to 0");
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "argument error: " << ex.what() << '\n';
    return 2;
  }

  std::string err;
  const int fd = stt_integrity::transport::connect_tcp(argv[1], port, err);
  if (fd < 0) {
    std::cerr << "[probe] " << err << '\n';
    return 1;
  }
  std::cerr << "[probe] sending " << chunks << " chunk(s) mode=" << stt_integrity::client::to_string(mode)
            << " interval_ms=" << interval_ms << '\n';

  const auto samples = stt_integrity::client::generate_tone(kSampleRate, kChunkMs);
  bool rejected = false;
  bool connected = true;
  int sent = 0;
  for (; sent < chunks && connected; ++sent) {
    const auto frame =
        stt_integrity::client::build_chunk(mode, kSampleRate, samples, stt_integrity::core::unix_timestamp_now_ms());
    if (!stt_integrity::transport::write_message(fd, frame.data(), frame.size(), err)) {
      std::cerr << "[probe] " << err << '\n';
      break;
    }
    connected = drain_responses(fd, interval_ms, rejected);
  }
  if (connected) {
    connected = drain_responses(fd, kFinalWaitMs, rejected);
  }
  ::close(fd);

  std::cout << "[probe] sent=" << sent << " rejected=" << (rejected ? "true" : "false")
            << " disconnected=" << (connected ? "false" : "true") << '\n';
  return (!stt_integrity::client::expects_rejection(mode) && rejected) ? 1 : 0;
}

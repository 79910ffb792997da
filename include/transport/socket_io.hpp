#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "server/interfaces.hpp"

namespace stt_integrity::transport {

// Stream messages are [u32 LE length][length bytes].
constexpr std::uint32_t kDefaultMaxMessageBytes = 1024U * 1024U;

// Returns false on EOF or socket failure before n bytes arrive.
bool read_exact(int fd, std::uint8_t* buf, std::size_t n);

// Returns false on EOF (err empty) or on a fatal I/O/protocol error (err set).
bool read_message(int fd, std::vector<std::uint8_t>& out, std::string& err,
                  std::uint32_t max_len = kDefaultMaxMessageBytes);

bool write_message(int fd, const std::uint8_t* data, std::size_t len, std::string& err);

// Returns a connected socket, or -1 with err set.
int connect_tcp(const std::string& host, std::uint16_t port, std::string& err);

std::string peer_address(int fd);

// Transport over an accepted socket. The socket itself is owned and closed by
// the server; close() only shuts it down so the worker's read unblocks.
class SocketTransport : public server::Transport {
 public:
  SocketTransport(int fd, std::string client_id);

  [[nodiscard]] const std::string& client_id() const override { return client_id_; }
  bool send_text(const std::string& text) override;
  void close() override;

  [[nodiscard]] bool is_closed() const;

 private:
  int fd_;
  std::string client_id_;
  mutable std::mutex mutex_;
  bool closed_{false};
};

}  // namespace stt_integrity::transport

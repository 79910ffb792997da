#include "transport/socket_io.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace stt_integrity::transport {

bool read_exact(const int fd, std::uint8_t* buf, const std::size_t n) {
  std::size_t remaining = n;
  while (remaining > 0) {
    const ssize_t received = ::recv(fd, buf, remaining, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    if (received <= 0) {
      return false;
    }
    buf += received;
    remaining -= static_cast<std::size_t>(received);
  }
  return true;
}

bool read_message(const int fd, std::vector<std::uint8_t>& out, std::string& err, const std::uint32_t max_len) {
  err.clear();

  std::uint8_t prefix[4];
  if (!read_exact(fd, prefix, sizeof(prefix))) {
    return false;
  }

  const std::uint32_t length = static_cast<std::uint32_t>(prefix[0]) | (static_cast<std::uint32_t>(prefix[1]) << 8U) |
                               (static_cast<std::uint32_t>(prefix[2]) << 16U) |
                               (static_cast<std::uint32_t>(prefix[3]) << 24U);
  if (length > max_len) {
    err = "message of " + std::to_string(length) + " bytes exceeds limit " + std::to_string(max_len);
    return false;
  }

  out.resize(length);
  if (length > 0 && !read_exact(fd, out.data(), length)) {
    err = "connection closed mid-message";
    return false;
  }
  return true;
}

bool write_message(const int fd, const std::uint8_t* data, const std::size_t len, std::string& err) {
  err.clear();
  if (len > 0xFFFFFFFFULL) {
    err = "message too large";
    return false;
  }

  std::vector<std::uint8_t> buffer;
  buffer.reserve(4 + len);
  const auto length = static_cast<std::uint32_t>(len);
  buffer.push_back(static_cast<std::uint8_t>(length & 0xFFU));
  buffer.push_back(static_cast<std::uint8_t>((length >> 8U) & 0xFFU));
  buffer.push_back(static_cast<std::uint8_t>((length >> 16U) & 0xFFU));
  buffer.push_back(static_cast<std::uint8_t>((length >> 24U) & 0xFFU));
  buffer.insert(buffer.end(), data, data + len);

  const std::uint8_t* ptr = buffer.data();
  std::size_t remaining = buffer.size();
  while (remaining > 0) {
    const ssize_t sent = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
    if (sent < 0 && errno == EINTR) {
      continue;
    }
    if (sent <= 0) {
      err = std::string("send failed: ") + std::strerror(errno);
      return false;
    }
    ptr += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

int connect_tcp(const std::string& host, const std::uint16_t port, std::string& err) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* results = nullptr;
  const std::string service = std::to_string(port);
  const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
  if (rc != 0) {
    err = std::string("resolve failed: ") + ::gai_strerror(rc);
    return -1;
  }

  int fd = -1;
  for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      break;
    }
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(results);

  if (fd < 0) {
    err = "unable to connect to " + host + ":" + service;
  }
  return fd;
}

std::string peer_address(const int fd) {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return "unknown";
  }

  char host[INET6_ADDRSTRLEN] = {};
  std::uint16_t port = 0;
  if (addr.ss_family == AF_INET) {
    const auto* in4 = reinterpret_cast<const sockaddr_in*>(&addr);
    ::inet_ntop(AF_INET, &in4->sin_addr, host, sizeof(host));
    port = ntohs(in4->sin_port);
  } else if (addr.ss_family == AF_INET6) {
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
    ::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
    port = ntohs(in6->sin6_port);
  } else {
    return "local";
  }
  return std::string(host) + ":" + std::to_string(port);
}

SocketTransport::SocketTransport(const int fd, std::string client_id) : fd_(fd), client_id_(std::move(client_id)) {}

bool SocketTransport::send_text(const std::string& text) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }
  std::string err;
  return write_message(fd_, reinterpret_cast<const std::uint8_t*>(text.data()), text.size(), err);
}

void SocketTransport::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;
  ::shutdown(fd_, SHUT_RDWR);
}

bool SocketTransport::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

}  // namespace stt_integrity::transport

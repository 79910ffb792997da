#include "server/tcp_server.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <utility>

#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "server/connection_handler.hpp"
#include "transport/socket_io.hpp"

namespace stt_integrity::server {
namespace {

constexpr int kAcceptPollTimeoutMs = 250;
constexpr int kListenBacklog = 64;

}  // namespace

TcpServer::TcpServer(const core::ServerConfig& config, AudioConsumer& consumer, sinks::VerdictLogSink& log,
                     sinks::RedisTsSink* metrics)
    : host_(config.host),
      port_(config.port),
      max_message_bytes_(config.max_message_bytes),
      policy_(core::make_policy(config.policy)),
      consumer_(consumer),
      log_(log),
      metrics_(metrics) {}

TcpServer::~TcpServer() {
  running_ = false;
  shutdown_connections();
}

bool TcpServer::start(std::string& err) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  addrinfo* results = nullptr;
  const std::string service = std::to_string(port_);
  const int rc = ::getaddrinfo(host_.c_str(), service.c_str(), &hints, &results);
  if (rc != 0) {
    err = std::string("resolve failed: ") + ::gai_strerror(rc);
    return false;
  }

  int fd = -1;
  for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      continue;
    }
    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, kListenBacklog) == 0) {
      break;
    }
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(results);

  if (fd < 0) {
    err = "unable to listen on " + host_ + ":" + service + ": " + std::strerror(errno);
    return false;
  }

  sockaddr_storage bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
    if (bound.ss_family == AF_INET) {
      bound_port_ = ntohs(reinterpret_cast<const sockaddr_in*>(&bound)->sin_port);
    } else if (bound.ss_family == AF_INET6) {
      bound_port_ = ntohs(reinterpret_cast<const sockaddr_in6*>(&bound)->sin6_port);
    }
  }

  listen_fd_ = fd;
  running_ = true;
  return true;
}

void TcpServer::run(const volatile std::sig_atomic_t& shutdown_requested) {
  while (running_ && shutdown_requested == 0) {
    pollfd pfd{};
    pfd.fd = listen_fd_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, kAcceptPollTimeoutMs);
    reap_workers(false);
    if (ready <= 0) {
      continue;
    }

    const int client_fd = ::accept(listen_fd_, nullptr, nullptr);
    if (client_fd < 0) {
      if (errno != EINTR && errno != EAGAIN && running_) {
        log_.transport_error("listener", std::string("accept failed: ") + std::strerror(errno));
      }
      continue;
    }

    const std::string client_id = transport::peer_address(client_fd);
    std::lock_guard<std::mutex> lock(workers_mutex_);
    active_fds_.insert(client_fd);
    auto done = std::make_shared<std::atomic<bool>>(false);
    workers_.push_back(Worker{std::thread([this, client_fd, client_id, done]() {
                                serve_connection(client_fd, client_id);
                                done->store(true);
                              }),
                              done});
  }
  running_ = false;
  shutdown_connections();
}

void TcpServer::stop() noexcept {
  running_ = false;
}

void TcpServer::shutdown_connections() {
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }

  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (const int fd : active_fds_) {
      ::shutdown(fd, SHUT_RDWR);
    }
  }
  reap_workers(true);
}

model::IntegrityTotals TcpServer::totals() const {
  std::lock_guard<std::mutex> lock(totals_mutex_);
  return totals_;
}

void TcpServer::serve_connection(const int fd, const std::string& client_id) {
  transport::SocketTransport socket_transport(fd, client_id);
  ConnectionHandler handler(socket_transport, consumer_, log_, policy_);
  log_.connection_opened(client_id);

  std::vector<std::uint8_t> message;
  std::string err;
  while (!socket_transport.is_closed()) {
    if (!transport::read_message(fd, message, err, max_message_bytes_)) {
      if (!err.empty() && !socket_transport.is_closed()) {
        log_.transport_error(client_id, err);
      }
      break;
    }

    try {
      if (handler.handle_message(message) == HandleResult::CLOSE) {
        break;
      }
    } catch (const std::exception& ex) {
      log_.transport_error(client_id, std::string("message handling failed: ") + ex.what());
      break;
    }
  }

  handler.on_disconnect();
  socket_transport.close();
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    active_fds_.erase(fd);
    ::close(fd);
  }

  log_.connection_closed(client_id, handler.stats());
  record_connection(handler.stats());
}

void TcpServer::record_connection(const model::ConnectionStats& stats) {
  if (metrics_ == nullptr) {
    std::lock_guard<std::mutex> lock(totals_mutex_);
    model::accumulate(totals_, stats);
    return;
  }

  // Snapshots are taken under metrics_mutex_ so publishes stay in order.
  std::lock_guard<std::mutex> metrics_lock(metrics_mutex_);
  model::IntegrityTotals snapshot{};
  {
    std::lock_guard<std::mutex> lock(totals_mutex_);
    model::accumulate(totals_, stats);
    snapshot = totals_;
  }

  if (!metrics_->publish(snapshot)) {
    log_.transport_error("redis", "failed to publish integrity metrics");
    return;
  }

  std::lock_guard<std::mutex> lock(totals_mutex_);
  totals_.redis_latency_ms = snapshot.redis_latency_ms;
}

void TcpServer::reap_workers(const bool wait_all) {
  std::vector<Worker> finished;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = workers_.begin();
    while (it != workers_.end()) {
      if (wait_all || it->done->load()) {
        finished.push_back(std::move(*it));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (auto& worker : finished) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

}  // namespace stt_integrity::server

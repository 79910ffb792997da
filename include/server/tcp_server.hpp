#pragma once

#include <atomic>
#include <csignal>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "core/config.hpp"
#include "core/policy.hpp"
#include "model/frame.hpp"
#include "server/interfaces.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/verdict_log.hpp"

namespace stt_integrity::server {

// Accepts stream connections and runs one worker thread per connection.
class TcpServer {
 public:
  // metrics may be null when Redis publishing is disabled.
  TcpServer(const core::ServerConfig& config, AudioConsumer& consumer, sinks::VerdictLogSink& log,
            sinks::RedisTsSink* metrics);
  ~TcpServer();

  TcpServer(const TcpServer&) = delete;
  TcpServer& operator=(const TcpServer&) = delete;

  bool start(std::string& err);
  // Accept loop; returns once shutdown_requested becomes non-zero or stop() is called.
  // The listener and live connections are torn down on the thread running this loop.
  void run(const volatile std::sig_atomic_t& shutdown_requested);
  // Safe from any thread.
  void stop() noexcept;

  [[nodiscard]] std::uint16_t bound_port() const noexcept { return bound_port_; }
  [[nodiscard]] model::IntegrityTotals totals() const;

 private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void serve_connection(int fd, const std::string& client_id);
  void record_connection(const model::ConnectionStats& stats);
  void shutdown_connections();
  void reap_workers(bool wait_all);

  std::string host_;
  std::uint16_t port_;
  std::uint32_t max_message_bytes_;
  core::PolicyPtr policy_;
  AudioConsumer& consumer_;
  sinks::VerdictLogSink& log_;
  sinks::RedisTsSink* metrics_;

  int listen_fd_{-1};
  std::uint16_t bound_port_{0};
  std::atomic<bool> running_{false};

  std::mutex workers_mutex_;
  std::vector<Worker> workers_;
  std::unordered_set<int> active_fds_;

  std::mutex metrics_mutex_;
  mutable std::mutex totals_mutex_;
  model::IntegrityTotals totals_{};
};

}  // namespace stt_integrity::server

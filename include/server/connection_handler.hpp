#pragma once

#include <cstdint>
#include <vector>

#include "core/connection_tracker.hpp"
#include "core/policy.hpp"
#include "model/frame.hpp"
#include "server/interfaces.hpp"
#include "sinks/verdict_log.hpp"

namespace stt_integrity::server {

enum class HandleResult : std::uint8_t {
  CONTINUE = 0,
  CLOSE = 1,
};

// Per-connection pipeline: decode, verify, apply policy, act. Driven by a
// single worker in arrival order; holds no state shared with other
// connections.
class ConnectionHandler {
 public:
  ConnectionHandler(Transport& transport, AudioConsumer& consumer, sinks::VerdictLogSink& log,
                    core::PolicyPtr policy);

  HandleResult handle_message(const std::vector<std::uint8_t>& message);
  void on_disconnect() noexcept;

  [[nodiscard]] const model::ConnectionStats& stats() const noexcept { return stats_; }
  [[nodiscard]] const core::ConnectionTracker& tracker() const noexcept { return tracker_; }

 private:
  HandleResult reject(const model::VerificationVerdict& verdict, const core::TrackerDecision& decision);

  Transport& transport_;
  AudioConsumer& consumer_;
  sinks::VerdictLogSink& log_;
  core::PolicyPtr policy_;
  core::ConnectionTracker tracker_;
  model::ConnectionStats stats_{};
};

}  // namespace stt_integrity::server

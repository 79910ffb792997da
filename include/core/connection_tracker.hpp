#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "core/policy.hpp"
#include "model/frame.hpp"

namespace stt_integrity::core {

struct ConnectionState {
  std::string client_id{};
  std::uint32_t failure_count{0};
  std::chrono::system_clock::time_point created_at{};
};

// Result of feeding one verdict to a tracker. failure_count is the value after
// the transition, still available once a rejection has discarded the state.
struct TrackerDecision {
  model::Action action{model::Action::ACCEPT};
  std::uint32_t failure_count{0};
};

// Transition rules for one verdict. Only a failing verdict touches state.
model::Action evaluate_verdict(ConnectionState& state, const std::optional<model::VerificationVerdict>& verdict,
                               const PolicyConfig& policy) noexcept;

class ConnectionTracker {
 public:
  ConnectionTracker(std::string client_id, PolicyPtr policy);

  // Throws std::logic_error once the connection has left ACTIVE.
  TrackerDecision on_verdict(const std::optional<model::VerificationVerdict>& verdict);
  void on_close() noexcept;

  [[nodiscard]] model::ConnectionPhase phase() const noexcept { return phase_; }
  [[nodiscard]] const std::optional<ConnectionState>& state() const noexcept { return state_; }
  [[nodiscard]] const std::string& client_id() const noexcept { return client_id_; }

 private:
  std::string client_id_;
  PolicyPtr policy_;
  std::optional<ConnectionState> state_{};
  model::ConnectionPhase phase_{model::ConnectionPhase::ACTIVE};
};

}  // namespace stt_integrity::core

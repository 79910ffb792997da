#include "core/connection_tracker.hpp"

#include <stdexcept>
#include <utility>

namespace stt_integrity::core {

model::Action evaluate_verdict(ConnectionState& state, const std::optional<model::VerificationVerdict>& verdict,
                               const PolicyConfig& policy) noexcept {
  if (!verdict.has_value() || verdict->ok) {
    return model::Action::ACCEPT;
  }

  ++state.failure_count;

  if (!policy.reject_enabled) {
    return model::Action::ACCEPT_WITH_WARNING;
  }

  // "Exceeds" rather than "reaches": threshold 0 rejects the first failure.
  if (state.failure_count <= policy.corruption_threshold) {
    return model::Action::ACCEPT_WITH_WARNING;
  }
  return model::Action::REJECT;
}

ConnectionTracker::ConnectionTracker(std::string client_id, PolicyPtr policy)
    : client_id_(std::move(client_id)), policy_(std::move(policy)) {
  if (policy_ == nullptr) {
    throw std::invalid_argument("connection tracker requires a policy");
  }
  state_ = ConnectionState{client_id_, 0, std::chrono::system_clock::now()};
}

TrackerDecision ConnectionTracker::on_verdict(const std::optional<model::VerificationVerdict>& verdict) {
  if (phase_ != model::ConnectionPhase::ACTIVE || !state_.has_value()) {
    throw std::logic_error("verdict received for inactive connection " + client_id_);
  }

  TrackerDecision decision{};
  decision.action = evaluate_verdict(*state_, verdict, *policy_);
  decision.failure_count = state_->failure_count;

  if (decision.action == model::Action::REJECT) {
    state_.reset();
    phase_ = model::ConnectionPhase::REJECTED;
  }
  return decision;
}

void ConnectionTracker::on_close() noexcept {
  state_.reset();
  if (phase_ == model::ConnectionPhase::ACTIVE) {
    phase_ = model::ConnectionPhase::DISCONNECTED;
  }
}

}  // namespace stt_integrity::core

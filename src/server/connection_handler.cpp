#include "server/connection_handler.hpp"

#include <optional>
#include <utility>

#include "integrity/verifier.hpp"
#include "protocol/frame_codec.hpp"
#include "protocol/rejection_notice.hpp"

namespace stt_integrity::server {

ConnectionHandler::ConnectionHandler(Transport& transport, AudioConsumer& consumer, sinks::VerdictLogSink& log,
                                     core::PolicyPtr policy)
    : transport_(transport),
      consumer_(consumer),
      log_(log),
      policy_(std::move(policy)),
      tracker_(transport_.client_id(), policy_) {}

HandleResult ConnectionHandler::handle_message(const std::vector<std::uint8_t>& message) {
  if (tracker_.phase() != model::ConnectionPhase::ACTIVE) {
    return HandleResult::CLOSE;
  }

  ++stats_.frames_received;

  model::DecodedFrame frame;
  try {
    frame = protocol::decode_frame(message);
  } catch (const protocol::FrameDecodeError& ex) {
    ++stats_.decode_errors;
    log_.decode_error(transport_.client_id(), protocol::to_string(ex.code()), ex.what());
    if (policy_->close_on_decode_error) {
      transport_.close();
      return HandleResult::CLOSE;
    }
    return HandleResult::CONTINUE;
  }

  const std::optional<model::VerificationVerdict> verdict =
      integrity::verify_if_requested(frame.metadata, frame.payload, *policy_);
  const core::TrackerDecision decision = tracker_.on_verdict(verdict);

  if (verdict.has_value()) {
    ++stats_.frames_verified;
    if (!verdict->ok) {
      ++stats_.verification_failures;
    }
    log_.publish(transport_.client_id(), *verdict, decision);
  }

  if (decision.action == model::Action::REJECT) {
    return reject(*verdict, decision);
  }

  consumer_.consume(transport_.client_id(), frame.metadata, frame.payload);
  ++stats_.frames_accepted;
  return HandleResult::CONTINUE;
}

HandleResult ConnectionHandler::reject(const model::VerificationVerdict& verdict,
                                       const core::TrackerDecision& decision) {
  stats_.rejected = true;
  log_.rejected(transport_.client_id(), decision.failure_count, policy_->corruption_threshold);

  const auto notice =
      protocol::make_rejection_notice(verdict, decision.failure_count, policy_->corruption_threshold);
  if (!transport_.send_text(notice.dump())) {
    log_.transport_error(transport_.client_id(), "rejection notice could not be delivered");
  }
  transport_.close();
  return HandleResult::CLOSE;
}

void ConnectionHandler::on_disconnect() noexcept {
  tracker_.on_close();
}

}  // namespace stt_integrity::server

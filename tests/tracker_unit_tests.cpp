#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/connection_tracker.hpp"
#include "core/policy.hpp"
#include "model/frame.hpp"
#include "protocol/frame_codec.hpp"
#include "protocol/rejection_notice.hpp"
#include "server/connection_handler.hpp"
#include "server/interfaces.hpp"
#include "sinks/verdict_log.hpp"

using stt_integrity::core::ConnectionState;
using stt_integrity::core::ConnectionTracker;
using stt_integrity::core::PolicyConfig;
using stt_integrity::core::evaluate_verdict;
using stt_integrity::core::make_policy;
using stt_integrity::model::Action;
using stt_integrity::model::ConnectionPhase;
using stt_integrity::model::Metadata;
using stt_integrity::model::VerificationVerdict;
using stt_integrity::protocol::encode_frame;
using stt_integrity::protocol::make_metadata;
using stt_integrity::protocol::make_rejection_notice;
using stt_integrity::server::ConnectionHandler;
using stt_integrity::server::HandleResult;
using stt_integrity::sinks::VerdictLogSink;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

VerificationVerdict passing_verdict() {
  return VerificationVerdict{4, 4, 10, 10, true};
}

VerificationVerdict failing_verdict() {
  return VerificationVerdict{4, 4, 10, 11, false};
}

PolicyConfig rejecting_policy(const std::uint32_t threshold) {
  PolicyConfig policy{};
  policy.verify_enabled = true;
  policy.reject_enabled = true;
  policy.corruption_threshold = threshold;
  return policy;
}

class RecordingTransport : public stt_integrity::server::Transport {
 public:
  [[nodiscard]] const std::string& client_id() const override { return client_id_; }
  bool send_text(const std::string& text) override {
    sent.push_back(text);
    return true;
  }
  void close() override { ++close_calls; }

  std::vector<std::string> sent{};
  int close_calls{0};

 private:
  std::string client_id_{"10.0.0.7:50123"};
};

class RecordingConsumer : public stt_integrity::server::AudioConsumer {
 public:
  void consume(const std::string&, const Metadata&, const std::vector<std::uint8_t>& payload) override {
    payload_sizes.push_back(payload.size());
  }

  std::vector<std::size_t> payload_sizes{};
};

std::vector<std::uint8_t> frame_of(const std::vector<std::int16_t>& declared, const std::vector<std::int16_t>& sent) {
  return encode_frame(make_metadata(16000, declared, 0), sent);
}

int test_evaluate_verdict_transition_rules() {
  ConnectionState state{"client", 0, {}};
  const PolicyConfig strict = rejecting_policy(0);

  if (evaluate_verdict(state, std::nullopt, strict) != Action::ACCEPT || state.failure_count != 0) {
    return fail("test_evaluate_verdict_transition_rules", "missing verdict should accept without counting");
  }
  if (evaluate_verdict(state, passing_verdict(), strict) != Action::ACCEPT || state.failure_count != 0) {
    return fail("test_evaluate_verdict_transition_rules", "passing verdict should accept without counting");
  }
  if (evaluate_verdict(state, failing_verdict(), strict) != Action::REJECT || state.failure_count != 1) {
    return fail("test_evaluate_verdict_transition_rules", "threshold 0 should reject the first failure");
  }

  PolicyConfig monitor_only = strict;
  monitor_only.reject_enabled = false;
  ConnectionState monitored{"client", 0, {}};
  for (int i = 0; i < 5; ++i) {
    if (evaluate_verdict(monitored, failing_verdict(), monitor_only) != Action::ACCEPT_WITH_WARNING) {
      return fail("test_evaluate_verdict_transition_rules", "monitor-only mode must never reject");
    }
  }
  if (monitored.failure_count != 5) {
    return fail("test_evaluate_verdict_transition_rules", "monitor-only mode should still count failures");
  }
  return 0;
}

int test_tolerant_threshold_rejects_third_failure() {
  ConnectionTracker tracker("client", make_policy(rejecting_policy(2)));

  auto decision = tracker.on_verdict(failing_verdict());
  if (decision.action != Action::ACCEPT_WITH_WARNING || decision.failure_count != 1) {
    return fail("test_tolerant_threshold_rejects_third_failure", "failure 1 should be tolerated");
  }

  decision = tracker.on_verdict(passing_verdict());
  if (decision.action != Action::ACCEPT || tracker.state()->failure_count != 1) {
    return fail("test_tolerant_threshold_rejects_third_failure", "passing verdict must not reset failures");
  }

  decision = tracker.on_verdict(failing_verdict());
  if (decision.action != Action::ACCEPT_WITH_WARNING || decision.failure_count != 2) {
    return fail("test_tolerant_threshold_rejects_third_failure", "failure 2 should be tolerated");
  }

  decision = tracker.on_verdict(failing_verdict());
  if (decision.action != Action::REJECT || decision.failure_count != 3) {
    return fail("test_tolerant_threshold_rejects_third_failure", "failure 3 should reject");
  }

  if (tracker.phase() != ConnectionPhase::REJECTED || tracker.state().has_value()) {
    return fail("test_tolerant_threshold_rejects_third_failure", "rejection should discard connection state");
  }
  return 0;
}

int test_tracker_lifecycle_is_terminal() {
  ConnectionTracker rejected("client", make_policy(rejecting_policy(0)));
  if (!rejected.state().has_value() || rejected.state()->client_id != "client") {
    return fail("test_tracker_lifecycle_is_terminal", "state should exist while active");
  }
  (void)rejected.on_verdict(failing_verdict());

  bool threw = false;
  try {
    (void)rejected.on_verdict(passing_verdict());
  } catch (const std::logic_error&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_tracker_lifecycle_is_terminal", "verdict after rejection should throw");
  }

  if (rejected.client_id() != "client") {
    return fail("test_tracker_lifecycle_is_terminal", "client id should outlive discarded state");
  }

  rejected.on_close();
  if (rejected.phase() != ConnectionPhase::REJECTED) {
    return fail("test_tracker_lifecycle_is_terminal", "close after rejection keeps the rejected phase");
  }

  ConnectionTracker closed("client", make_policy(rejecting_policy(3)));
  (void)closed.on_verdict(failing_verdict());
  closed.on_close();
  if (closed.phase() != ConnectionPhase::DISCONNECTED || closed.state().has_value()) {
    return fail("test_tracker_lifecycle_is_terminal", "close should discard state and disconnect");
  }

  bool null_policy_threw = false;
  try {
    ConnectionTracker invalid("client", nullptr);
  } catch (const std::invalid_argument&) {
    null_policy_threw = true;
  }
  if (!null_policy_threw) {
    return fail("test_tracker_lifecycle_is_terminal", "tracker without policy should throw");
  }
  return 0;
}

int test_rejection_notice_format() {
  const auto notice = make_rejection_notice(failing_verdict(), 1, 0);
  if (notice.at("type") != "error" || notice.at("error") != "data_corruption" ||
      notice.at("action") != "disconnect") {
    return fail("test_rejection_notice_format", "notice envelope fields mismatch");
  }

  const auto message = notice.at("message").get<std::string>();
  if (message.find("expected 10") == std::string::npos || message.find("got 11") == std::string::npos) {
    return fail("test_rejection_notice_format", "message should include expected and actual checksum");
  }
  if (message.find("length mismatch") != std::string::npos) {
    return fail("test_rejection_notice_format", "matching length should not be reported");
  }

  const auto both = make_rejection_notice(VerificationVerdict{104, 4, 10, 11, false}, 4, 3);
  const auto both_message = both.at("message").get<std::string>();
  if (both_message.find("expected 104, got 4") == std::string::npos ||
      both_message.find("expected 10, got 11") == std::string::npos) {
    return fail("test_rejection_notice_format", "both mismatches should be described");
  }
  return 0;
}

int test_verdict_log_filters_by_extended_logging() {
  std::ostringstream quiet_out;
  VerdictLogSink quiet(quiet_out, false);
  quiet.publish("client", passing_verdict(), {Action::ACCEPT, 0});
  if (!quiet_out.str().empty()) {
    return fail("test_verdict_log_filters_by_extended_logging", "passes should be silent without extended logging");
  }
  quiet.publish("client", failing_verdict(), {Action::ACCEPT_WITH_WARNING, 1});
  if (quiet_out.str().find("verification failed") == std::string::npos ||
      quiet_out.str().find("action=accept_with_warning") == std::string::npos) {
    return fail("test_verdict_log_filters_by_extended_logging", "failures should always be logged");
  }

  std::ostringstream verbose_out;
  VerdictLogSink verbose(verbose_out, true);
  verbose.publish("client", passing_verdict(), {Action::ACCEPT, 0});
  if (verbose_out.str().find("verified samples=4 checksum=0x0000000A") == std::string::npos) {
    return fail("test_verdict_log_filters_by_extended_logging", "extended logging should record passes");
  }
  return 0;
}

int test_handler_accepts_and_forwards_verified_audio() {
  RecordingTransport transport;
  RecordingConsumer consumer;
  std::ostringstream log_out;
  VerdictLogSink log(log_out, false);
  ConnectionHandler handler(transport, consumer, log, make_policy(rejecting_policy(0)));

  if (handler.handle_message(frame_of({1, 2, 3, 4}, {1, 2, 3, 4})) != HandleResult::CONTINUE) {
    return fail("test_handler_accepts_and_forwards_verified_audio", "valid frame should keep connection open");
  }
  if (consumer.payload_sizes.size() != 1 || consumer.payload_sizes.front() != 8) {
    return fail("test_handler_accepts_and_forwards_verified_audio", "valid payload should reach the consumer");
  }
  if (!transport.sent.empty() || transport.close_calls != 0) {
    return fail("test_handler_accepts_and_forwards_verified_audio", "valid frame should not notify or close");
  }
  if (handler.stats().frames_verified != 1 || handler.stats().frames_accepted != 1) {
    return fail("test_handler_accepts_and_forwards_verified_audio", "stats should count the verified frame");
  }
  return 0;
}

int test_handler_monitor_mode_forwards_corrupt_audio() {
  RecordingTransport transport;
  RecordingConsumer consumer;
  std::ostringstream log_out;
  VerdictLogSink log(log_out, false);
  PolicyConfig policy = rejecting_policy(0);
  policy.reject_enabled = false;
  ConnectionHandler handler(transport, consumer, log, make_policy(policy));

  if (handler.handle_message(frame_of({1, 2, 3, 4}, {1, 2, 3, 5})) != HandleResult::CONTINUE) {
    return fail("test_handler_monitor_mode_forwards_corrupt_audio", "monitor mode should not close");
  }
  if (consumer.payload_sizes.size() != 1) {
    return fail("test_handler_monitor_mode_forwards_corrupt_audio", "corrupt payload is still forwarded");
  }
  if (log_out.str().find("expected 10, got 11") == std::string::npos) {
    return fail("test_handler_monitor_mode_forwards_corrupt_audio", "failure should be logged");
  }
  if (handler.tracker().state()->failure_count != 1) {
    return fail("test_handler_monitor_mode_forwards_corrupt_audio", "failure should be counted");
  }
  return 0;
}

int test_handler_rejects_on_first_failure() {
  RecordingTransport transport;
  RecordingConsumer consumer;
  std::ostringstream log_out;
  VerdictLogSink log(log_out, false);
  ConnectionHandler handler(transport, consumer, log, make_policy(rejecting_policy(0)));

  if (handler.handle_message(frame_of({1, 2, 3, 4}, {1, 2, 3, 5})) != HandleResult::CLOSE) {
    return fail("test_handler_rejects_on_first_failure", "threshold 0 should close on first failure");
  }
  if (!consumer.payload_sizes.empty()) {
    return fail("test_handler_rejects_on_first_failure", "rejected payload must not be forwarded");
  }
  if (transport.sent.size() != 1 || transport.close_calls != 1) {
    return fail("test_handler_rejects_on_first_failure", "rejection should send one notice then close");
  }

  const auto notice = nlohmann::json::parse(transport.sent.front());
  const auto message = notice.at("message").get<std::string>();
  if (notice.at("error") != "data_corruption" || message.find("expected 10") == std::string::npos ||
      message.find("got 11") == std::string::npos) {
    return fail("test_handler_rejects_on_first_failure", "notice should describe the checksum mismatch");
  }
  if (log_out.str().find("client=10.0.0.7:50123 rejected after 1") == std::string::npos) {
    return fail("test_handler_rejects_on_first_failure", "rejection should be logged with client and count");
  }
  if (handler.handle_message(frame_of({1, 2, 3, 4}, {1, 2, 3, 4})) != HandleResult::CLOSE ||
      consumer.payload_sizes.size() != 0) {
    return fail("test_handler_rejects_on_first_failure", "rejected connection must not accept more frames");
  }
  return 0;
}

int test_handler_decode_errors_do_not_count_as_corruption() {
  RecordingTransport transport;
  RecordingConsumer consumer;
  std::ostringstream log_out;
  VerdictLogSink log(log_out, false);
  ConnectionHandler handler(transport, consumer, log, make_policy(rejecting_policy(0)));

  auto misaligned = frame_of({1, 2, 3, 4}, {1, 2, 3, 4});
  misaligned.pop_back();
  if (handler.handle_message(misaligned) != HandleResult::CONTINUE) {
    return fail("test_handler_decode_errors_do_not_count_as_corruption", "decode error should drop, not close");
  }
  if (handler.handle_message({0x01, 0x02}) != HandleResult::CONTINUE) {
    return fail("test_handler_decode_errors_do_not_count_as_corruption", "truncated frame should drop, not close");
  }
  if (handler.tracker().state()->failure_count != 0 || handler.stats().decode_errors != 2) {
    return fail("test_handler_decode_errors_do_not_count_as_corruption", "decode errors must not touch failures");
  }
  if (!consumer.payload_sizes.empty() || !transport.sent.empty()) {
    return fail("test_handler_decode_errors_do_not_count_as_corruption", "dropped frames must not be forwarded");
  }
  if (log_out.str().find("misaligned_payload") == std::string::npos ||
      log_out.str().find("truncated") == std::string::npos) {
    return fail("test_handler_decode_errors_do_not_count_as_corruption", "decode errors should be logged");
  }

  PolicyConfig closing = rejecting_policy(0);
  closing.close_on_decode_error = true;
  RecordingTransport closing_transport;
  ConnectionHandler closing_handler(closing_transport, consumer, log, make_policy(closing));
  if (closing_handler.handle_message(misaligned) != HandleResult::CLOSE || closing_transport.close_calls != 1) {
    return fail("test_handler_decode_errors_do_not_count_as_corruption", "close_on_decode_error should close");
  }
  return 0;
}

int test_handler_skips_verification_when_disabled() {
  RecordingTransport transport;
  RecordingConsumer consumer;
  std::ostringstream log_out;
  VerdictLogSink log(log_out, true);
  PolicyConfig policy = rejecting_policy(0);
  policy.verify_enabled = false;
  ConnectionHandler handler(transport, consumer, log, make_policy(policy));

  if (handler.handle_message(frame_of({1, 2, 3, 4}, {1, 2, 3, 5})) != HandleResult::CONTINUE) {
    return fail("test_handler_skips_verification_when_disabled", "disabled verification should accept");
  }
  if (handler.stats().frames_verified != 0 || !log_out.str().empty()) {
    return fail("test_handler_skips_verification_when_disabled", "no verdict should be produced or logged");
  }
  if (consumer.payload_sizes.size() != 1) {
    return fail("test_handler_skips_verification_when_disabled", "payload should be forwarded");
  }

  handler.on_disconnect();
  if (handler.tracker().phase() != ConnectionPhase::DISCONNECTED) {
    return fail("test_handler_skips_verification_when_disabled", "disconnect should end the tracker");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_evaluate_verdict_transition_rules(); rc != 0) return rc;
  if (int rc = test_tolerant_threshold_rejects_third_failure(); rc != 0) return rc;
  if (int rc = test_tracker_lifecycle_is_terminal(); rc != 0) return rc;
  if (int rc = test_rejection_notice_format(); rc != 0) return rc;
  if (int rc = test_verdict_log_filters_by_extended_logging(); rc != 0) return rc;
  if (int rc = test_handler_accepts_and_forwards_verified_audio(); rc != 0) return rc;
  if (int rc = test_handler_monitor_mode_forwards_corrupt_audio(); rc != 0) return rc;
  if (int rc = test_handler_rejects_on_first_failure(); rc != 0) return rc;
  if (int rc = test_handler_decode_errors_do_not_count_as_corruption(); rc != 0) return rc;
  if (int rc = test_handler_skips_verification_when_disabled(); rc != 0) return rc;

  std::cout << "[PASS] tracker unit tests\n";
  return 0;
}

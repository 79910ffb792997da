#include "sinks/verdict_log.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>

#include "protocol/rejection_notice.hpp"

namespace stt_integrity::sinks {

VerdictLogSink::VerdictLogSink(std::ostream& out, const bool extended_logging)
    : out_(out), extended_logging_(extended_logging) {}

void VerdictLogSink::publish(const std::string& client_id, const model::VerificationVerdict& verdict,
                             const core::TrackerDecision& decision) {
  if (verdict.ok && !extended_logging_) {
    return;
  }

  std::ostringstream line;
  line << "[integrity] client=" << client_id;
  if (verdict.ok) {
    line << " verified samples=" << verdict.length_actual << " checksum=0x" << std::hex << std::uppercase
         << std::setw(8) << std::setfill('0') << verdict.checksum_actual << std::dec;
  } else {
    line << " verification failed: " << protocol::describe_mismatch(verdict)
         << " failures=" << decision.failure_count;
  }
  line << " action=" << model::to_string(decision.action);
  write_line(line.str());
}

void VerdictLogSink::decode_error(const std::string& client_id, const std::string& error_code,
                                  const std::string& detail) {
  write_line("[integrity] client=" + client_id + " dropped frame: " + error_code + " (" + detail + ")");
}

void VerdictLogSink::transport_error(const std::string& client_id, const std::string& detail) {
  write_line("[server] client=" + client_id + " transport error: " + detail);
}

void VerdictLogSink::rejected(const std::string& client_id, const std::uint32_t failure_count,
                              const std::uint32_t corruption_threshold) {
  std::ostringstream line;
  line << "[integrity] client=" << client_id << " rejected after " << failure_count
       << " corrupted frame(s) (threshold=" << corruption_threshold << ")";
  write_line(line.str());
}

void VerdictLogSink::connection_opened(const std::string& client_id) {
  if (!extended_logging_) {
    return;
  }
  write_line("[server] client=" + client_id + " connected");
}

void VerdictLogSink::connection_closed(const std::string& client_id, const model::ConnectionStats& stats) {
  std::ostringstream line;
  line << "[server] client=" << client_id << " closed frames=" << stats.frames_received
       << " verified=" << stats.frames_verified << " failures=" << stats.verification_failures
       << " decode_errors=" << stats.decode_errors << " rejected=" << (stats.rejected ? "true" : "false");
  write_line(line.str());
}

void VerdictLogSink::write_line(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << line << '\n';
  out_.flush();
}

}  // namespace stt_integrity::sinks

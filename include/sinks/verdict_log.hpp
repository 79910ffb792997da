#pragma once

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>

#include "core/connection_tracker.hpp"
#include "model/frame.hpp"

namespace stt_integrity::sinks {

// Operator-facing log of verification outcomes. Shared by all connection
// workers, so every line is written under one lock.
class VerdictLogSink {
 public:
  VerdictLogSink(std::ostream& out, bool extended_logging);

  // Failures always; passes only with extended logging.
  void publish(const std::string& client_id, const model::VerificationVerdict& verdict,
               const core::TrackerDecision& decision);
  void decode_error(const std::string& client_id, const std::string& error_code, const std::string& detail);
  void transport_error(const std::string& client_id, const std::string& detail);
  void rejected(const std::string& client_id, std::uint32_t failure_count, std::uint32_t corruption_threshold);
  void connection_opened(const std::string& client_id);
  void connection_closed(const std::string& client_id, const model::ConnectionStats& stats);

 private:
  void write_line(const std::string& line);

  std::ostream& out_;
  bool extended_logging_;
  std::mutex mutex_;
};

}  // namespace stt_integrity::sinks

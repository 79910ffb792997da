#include "protocol/rejection_notice.hpp"

#include <sstream>

namespace stt_integrity::protocol {

std::string describe_mismatch(const model::VerificationVerdict& verdict) {
  std::ostringstream out;
  bool first = true;
  if (verdict.length_actual != verdict.length_expected) {
    out << "length mismatch (expected " << verdict.length_expected << ", got " << verdict.length_actual << ')';
    first = false;
  }
  if (verdict.checksum_actual != verdict.checksum_expected) {
    if (!first) {
      out << "; ";
    }
    out << "checksum mismatch (expected " << verdict.checksum_expected << ", got " << verdict.checksum_actual
        << ')';
    first = false;
  }
  if (first) {
    out << "no mismatch";
  }
  return out.str();
}

nlohmann::json make_rejection_notice(const model::VerificationVerdict& verdict, const std::uint32_t failure_count,
                                     const std::uint32_t corruption_threshold) {
  std::ostringstream message;
  message << "Data corruption detected: " << describe_mismatch(verdict) << ". " << failure_count
          << " corrupted frame(s) exceeds threshold " << corruption_threshold << "; closing connection";

  return nlohmann::json{{"type", "error"},
                        {"error", "data_corruption"},
                        {"message", message.str()},
                        {"action", "disconnect"}};
}

}  // namespace stt_integrity::protocol

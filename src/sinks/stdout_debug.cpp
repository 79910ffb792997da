#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace stt_integrity::sinks {

void StdoutDebugConsumer::consume(const std::string& client_id, const model::Metadata& metadata,
                                  const std::vector<std::uint8_t>& payload) {
  const double duration_ms = metadata.sample_rate > 0
                                 ? (static_cast<double>(payload.size() / 2) * 1000.0) / metadata.sample_rate
                                 : 0.0;
  std::printf("[audio] client=%s samples=%zu sample_rate=%u duration_ms=%.1f\n", client_id.c_str(),
              payload.size() / 2, metadata.sample_rate, duration_ms);
  std::fflush(stdout);
}

}  // namespace stt_integrity::sinks

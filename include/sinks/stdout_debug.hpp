#pragma once

#include "server/interfaces.hpp"

namespace stt_integrity::sinks {

class StdoutDebugConsumer : public server::AudioConsumer {
 public:
  void consume(const std::string& client_id, const model::Metadata& metadata,
               const std::vector<std::uint8_t>& payload) override;
};

}  // namespace stt_integrity::sinks

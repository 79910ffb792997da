#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "model/frame.hpp"

namespace stt_integrity::server {

// Ordered message stream for one client.
class Transport {
 public:
  virtual ~Transport() = default;

  [[nodiscard]] virtual const std::string& client_id() const = 0;
  virtual bool send_text(const std::string& text) = 0;
  virtual void close() = 0;
};

// Downstream recipient of accepted audio, e.g. the recognition pipeline.
class AudioConsumer {
 public:
  virtual ~AudioConsumer() = default;

  virtual void consume(const std::string& client_id, const model::Metadata& metadata,
                       const std::vector<std::uint8_t>& payload) = 0;
};

}  // namespace stt_integrity::server

#pragma once

#include <cstdint>
#include <string>

#include "core/policy.hpp"

namespace stt_integrity::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::uint32_t connect_timeout_ms{1000};
  std::string key_prefix{"stt:integrity"};
  bool enabled{false};
};

struct ServerConfig {
  std::string host{"0.0.0.0"};
  std::uint16_t port{8012};
  std::uint32_t max_message_bytes{1024U * 1024U};
  PolicyConfig policy{};
  RedisConfig redis{};
};

ServerConfig load_server_config(const std::string& path);

}  // namespace stt_integrity::core

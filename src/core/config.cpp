#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace stt_integrity::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::uint16_t parse_port(const std::string& key, const std::string& value) {
  const auto parsed_port = std::stoi(value);
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error(key + " port must be in range 1..65535");
  }
  return static_cast<std::uint16_t>(parsed_port);
}

std::uint32_t parse_u32(const std::string& key, const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed < 0) {
    throw std::runtime_error(key + " must be greater than or equal to 0");
  }
  if (parsed > static_cast<long long>(std::numeric_limits<std::uint32_t>::max())) {
    throw std::runtime_error(key + " exceeds uint32 range");
  }
  return static_cast<std::uint32_t>(parsed);
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  redis.port = parse_port("redis.address", value.substr(split + 1));
}

void apply_key_value(ServerConfig& config, const std::string& key, const std::string& value) {
  if (key == "server.host") {
    if (value.empty()) {
      throw std::runtime_error("server.host must not be empty");
    }
    config.host = value;
    return;
  }

  if (key == "server.port") {
    config.port = parse_port(key, value);
    return;
  }

  if (key == "server.max_message_bytes") {
    config.max_message_bytes = parse_u32(key, value);
    if (config.max_message_bytes == 0) {
      throw std::runtime_error("server.max_message_bytes must be greater than 0");
    }
    return;
  }

  if (key == "integrity.verify_data_integrity") {
    config.policy.verify_enabled = parse_bool(value);
    return;
  }

  if (key == "integrity.reject_corrupted_data") {
    config.policy.reject_enabled = parse_bool(value);
    return;
  }

  if (key == "integrity.corruption_threshold") {
    config.policy.corruption_threshold = parse_u32(key, value);
    return;
  }

  if (key == "integrity.extended_logging") {
    config.policy.extended_logging = parse_bool(value);
    return;
  }

  if (key == "integrity.close_on_decode_error") {
    config.policy.close_on_decode_error = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "redis.db") {
    const auto db = std::stoi(value);
    if (db < 0) {
      throw std::runtime_error("redis.db must be greater than or equal to 0");
    }
    config.redis.db = db;
    return;
  }

  if (key == "redis.connect_timeout_ms") {
    config.redis.connect_timeout_ms = parse_u32(key, value);
    if (config.redis.connect_timeout_ms == 0) {
      throw std::runtime_error("redis.connect_timeout_ms must be greater than 0");
    }
    return;
  }

  if (key == "redis.key_prefix") {
    config.redis.key_prefix = value;
  }
}

}  // namespace

ServerConfig load_server_config(const std::string& path) {
  ServerConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

}  // namespace stt_integrity::core

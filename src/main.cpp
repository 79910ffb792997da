#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "core/config.hpp"
#include "server/tcp_server.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"
#include "sinks/verdict_log.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

std::string format_config_settings(const stt_integrity::core::ServerConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[server] loaded config from " << config_path
         << " | listen=" << config.host << ':' << config.port
         << " | max_message_bytes=" << config.max_message_bytes
         << " | verify_data_integrity=" << (config.policy.verify_enabled ? "true" : "false")
         << " | reject_corrupted_data=" << (config.policy.reject_enabled ? "true" : "false")
         << " | corruption_threshold=" << config.policy.corruption_threshold
         << " | extended_logging=" << (config.policy.extended_logging ? "true" : "false")
         << " | close_on_decode_error=" << (config.policy.close_on_decode_error ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  output << " | redis_db=" << config.redis.db
         << " | redis_auth=" << (config.redis.password.empty() ? "false" : "true");
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/stt-integrity.yaml";

  stt_integrity::core::ServerConfig config{};
  try {
    config = stt_integrity::core::load_server_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  std::unique_ptr<stt_integrity::sinks::RedisTsSink> redis_sink{};
  if (config.redis.enabled) {
    stt_integrity::sinks::RedisTsOptions options;
    options.host = config.redis.host;
    options.port = config.redis.port;
    options.unix_socket = config.redis.unix_socket;
    options.password = config.redis.password;
    options.db = config.redis.db;
    options.connect_timeout_ms = config.redis.connect_timeout_ms;
    options.key_prefix = config.redis.key_prefix;
    redis_sink = std::make_unique<stt_integrity::sinks::RedisTsSink>(options);
    if (!redis_sink->check_connectivity()) {
      std::cerr << "[redis] initial connectivity check failed; will retry on publish\n";
    }
  }

  stt_integrity::sinks::VerdictLogSink log{std::cerr, config.policy.extended_logging};
  stt_integrity::sinks::StdoutDebugConsumer consumer{};
  stt_integrity::server::TcpServer server{config, consumer, log, redis_sink.get()};

  std::string err;
  if (!server.start(err)) {
    std::cerr << "[server] " << err << '\n';
    return 1;
  }
  std::cerr << "[server] listening on " << config.host << ':' << server.bound_port() << '\n';

  server.run(g_shutdown_requested);

  const auto totals = server.totals();
  std::cerr << "[server] shutdown signal received; connections=" << totals.connections_closed
            << " rejected=" << totals.connections_rejected << " frames=" << totals.frames_received
            << " failures=" << totals.verification_failures << '\n';

  return 0;
}

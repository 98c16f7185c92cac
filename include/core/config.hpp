#pragma once

#include <cstddef>
#include <string>

#include "core/log.hpp"

namespace toolwire::core {

struct ServerConfig {
  std::string name{"toolwire"};
  std::string version{"0.1.0"};
  std::string instructions{};
  std::size_t max_frame_bytes{4U * 1024U * 1024U};
  std::size_t worker_threads{4};
  LogLevel log_level{LogLevel::INFO};
};

ServerConfig load_server_config(const std::string& path);

// TOOLWIRE_SERVER_NAME, TOOLWIRE_MAX_FRAME_BYTES, TOOLWIRE_WORKER_THREADS, TOOLWIRE_LOG_LEVEL.
void apply_env_overrides(ServerConfig& config);

}  // namespace toolwire::core

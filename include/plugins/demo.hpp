#pragma once

#include "core/config.hpp"
#include "mcp/registry.hpp"

namespace toolwire::plugins {

// echo, server_time and the toolwire://server/info resource.
mcp::Registry build_demo_registry(const core::ServerConfig& config);

}  // namespace toolwire::plugins

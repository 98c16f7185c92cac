#include <iostream>
#include <sstream>
#include <string>

#include "core/config.hpp"
#include "core/log.hpp"
#include "mcp/server.hpp"
#include "mcp/transport.hpp"
#include "plugins/demo.hpp"

namespace {

std::string format_config_settings(const toolwire::core::ServerConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "loaded config from " << (config_path.empty() ? "<defaults>" : config_path)
         << " | name=" << config.name
         << " | version=" << config.version
         << " | max_frame_bytes=" << config.max_frame_bytes
         << " | worker_threads=" << config.worker_threads
         << " | log_level=" << toolwire::core::to_string(config.log_level);
  return output.str();
}

}  // namespace

int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  std::cin.tie(nullptr);

  const std::string config_path = argc > 1 ? argv[1] : "";

  toolwire::core::ServerConfig config{};
  try {
    if (!config_path.empty()) {
      config = toolwire::core::load_server_config(config_path);
    }
    toolwire::core::apply_env_overrides(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  toolwire::core::Logger logger(std::cerr, config.log_level);
  logger.info(format_config_settings(config, config_path));

  try {
    toolwire::mcp::Server server(config, toolwire::plugins::build_demo_registry(config), logger);
    logger.info("serving " + std::to_string(server.registry().list_tools().size()) + " tools and " +
                std::to_string(server.registry().list_resources().size()) + " resources on stdio");

    toolwire::mcp::StreamTransport transport(std::cin, std::cout, config.max_frame_bytes);
    return server.run(transport);
  } catch (const std::exception& ex) {
    logger.error(std::string("fatal: ") + ex.what());
    return 1;
  }
}

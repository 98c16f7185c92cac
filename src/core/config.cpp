#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolwire::core {
namespace {

constexpr long long kMinFrameBytes = 1024;
constexpr long long kMaxFrameBytes = 256LL * 1024 * 1024;
constexpr long long kMaxWorkerThreads = 64;

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

// Drops a trailing "# comment". A '#' inside a value that starts with a quote is kept.
void strip_comment(std::string& line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      }
    } else if ((c == '"' || c == '\'') && (i == 0 || line[i - 1] == ' ' || line[i - 1] == ':')) {
      quote = c;
    } else if (c == '#') {
      line.erase(i);
      return;
    }
  }
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

long long parse_integer_in_range(const std::string& key, const std::string& value, const long long min,
                                 const long long max) {
  long long parsed = 0;
  std::size_t consumed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::logic_error&) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer");
  }

  if (parsed < min || parsed > max) {
    throw std::runtime_error(key + " must be in range " + std::to_string(min) + ".." + std::to_string(max));
  }
  return parsed;
}

void apply_key_value(ServerConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "server.name") {
    if (value.empty()) {
      throw std::runtime_error("server.name must not be empty");
    }
    config.name = value;
    return;
  }

  if (key == "server.version") {
    if (value.empty()) {
      throw std::runtime_error("server.version must not be empty");
    }
    config.version = value;
    return;
  }

  if (key == "server.instructions") {
    config.instructions = value;
    return;
  }

  if (key == "transport.max_frame_bytes") {
    config.max_frame_bytes =
        static_cast<std::size_t>(parse_integer_in_range(key, value, kMinFrameBytes, kMaxFrameBytes));
    return;
  }

  if (key == "dispatch.worker_threads") {
    config.worker_threads = static_cast<std::size_t>(parse_integer_in_range(key, value, 0, kMaxWorkerThreads));
    return;
  }

  if (key == "log.level") {
    config.log_level = parse_log_level(value);
  }
}

const char* getenv_or_null(const char* name) {
  const auto* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
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
    strip_comment(line);

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

    sections.resize(depth);

    if (value.empty()) {
      sections.push_back(key);
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

void apply_env_overrides(ServerConfig& config) {
  if (const auto* value = getenv_or_null("TOOLWIRE_SERVER_NAME"); value != nullptr) {
    apply_key_value(config, "server.name", value);
  }
  if (const auto* value = getenv_or_null("TOOLWIRE_MAX_FRAME_BYTES"); value != nullptr) {
    apply_key_value(config, "transport.max_frame_bytes", value);
  }
  if (const auto* value = getenv_or_null("TOOLWIRE_WORKER_THREADS"); value != nullptr) {
    apply_key_value(config, "dispatch.worker_threads", value);
  }
  if (const auto* value = getenv_or_null("TOOLWIRE_LOG_LEVEL"); value != nullptr) {
    apply_key_value(config, "log.level", value);
  }
}

}  // namespace toolwire::core

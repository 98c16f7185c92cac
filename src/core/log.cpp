#include "core/log.hpp"

#include <algorithm>
#include <cctype>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace toolwire::core {

const char* to_string(const LogLevel level) noexcept {
  switch (level) {
    case LogLevel::DEBUG:
      return "debug";
    case LogLevel::INFO:
      return "info";
    case LogLevel::WARN:
      return "warn";
    case LogLevel::ERROR:
      return "error";
    case LogLevel::OFF:
      return "off";
  }
  return "unknown";
}

LogLevel parse_log_level(const std::string& value) {
  std::string lower(value);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "debug") {
    return LogLevel::DEBUG;
  }
  if (lower == "info") {
    return LogLevel::INFO;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::WARN;
  }
  if (lower == "error") {
    return LogLevel::ERROR;
  }
  if (lower == "off" || lower == "none") {
    return LogLevel::OFF;
  }
  throw std::runtime_error("unknown log level: " + value);
}

Logger::Logger(std::ostream& out, const LogLevel level, std::string tag)
    : out_(out), level_(level), tag_(std::move(tag)) {}

bool Logger::enabled(const LogLevel level) const noexcept {
  const auto threshold = level_.load();
  return threshold != LogLevel::OFF && level != LogLevel::OFF && level >= threshold;
}

void Logger::log(const LogLevel level, std::string_view message) {
  if (!enabled(level)) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  out_ << '[' << tag_ << "] " << to_string(level) << ": " << message << '\n';
  out_.flush();
}

}  // namespace toolwire::core

#pragma once

#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

namespace toolwire::core {

enum class LogLevel : std::uint8_t {
  DEBUG = 0,
  INFO = 1,
  WARN = 2,
  ERROR = 3,
  OFF = 4,
};

const char* to_string(LogLevel level) noexcept;
LogLevel parse_log_level(const std::string& value);

// Line-oriented diagnostics on stderr. stdout is reserved for protocol frames.
class Logger {
 public:
  explicit Logger(std::ostream& out, LogLevel level = LogLevel::INFO, std::string tag = "toolwire");

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void set_level(LogLevel level) noexcept { level_.store(level); }
  [[nodiscard]] LogLevel level() const noexcept { return level_.load(); }
  [[nodiscard]] bool enabled(LogLevel level) const noexcept;

  void log(LogLevel level, std::string_view message);

  void debug(std::string_view message) { log(LogLevel::DEBUG, message); }
  void info(std::string_view message) { log(LogLevel::INFO, message); }
  void warn(std::string_view message) { log(LogLevel::WARN, message); }
  void error(std::string_view message) { log(LogLevel::ERROR, message); }

 private:
  std::ostream& out_;
  std::atomic<LogLevel> level_;
  std::string tag_;
  std::mutex mutex_;
};

}  // namespace toolwire::core

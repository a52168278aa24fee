#pragma once

#include <string_view>

namespace pricebase
{

enum class LogLevel
{
  Debug,
  Info,
  Warn,
  Error
};

std::string_view toString(LogLevel level) noexcept;

// Accepts "debug", "info", "warn"/"warning", "error" (case-insensitive)
bool parseLogLevel(std::string_view text, LogLevel& out) noexcept;

struct ILogger
{
  virtual ~ILogger() = default;

  virtual void log(LogLevel level, std::string_view msg) = 0;

  void debug(std::string_view msg) { log(LogLevel::Debug, msg); }
  void info(std::string_view msg) { log(LogLevel::Info, msg); }
  void warn(std::string_view msg) { log(LogLevel::Warn, msg); }
  void error(std::string_view msg) { log(LogLevel::Error, msg); }
};

}  // namespace pricebase

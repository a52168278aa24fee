#include "pricebase/log/console_logger.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace pricebase
{

std::string_view toString(LogLevel level) noexcept
{
  switch (level)
  {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
  }
  return "UNKNOWN";
}

bool parseLogLevel(std::string_view text, LogLevel& out) noexcept
{
  std::string lowered;
  lowered.reserve(text.size());
  for (char c : text)
  {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lowered == "debug")
  {
    out = LogLevel::Debug;
  }
  else if (lowered == "info")
  {
    out = LogLevel::Info;
  }
  else if (lowered == "warn" || lowered == "warning")
  {
    out = LogLevel::Warn;
  }
  else if (lowered == "error")
  {
    out = LogLevel::Error;
  }
  else
  {
    return false;
  }
  return true;
}

ConsoleLogger::ConsoleLogger(LogLevel minLevel) : _minLevel(minLevel) {}

void ConsoleLogger::log(LogLevel level, std::string_view msg)
{
  std::lock_guard lock(_mutex);
  if (level < _minLevel)
  {
    return;
  }

  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm tm{};
  gmtime_r(&t, &tm);

  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);

  const auto levelName = toString(level);
  std::fprintf(stderr, "[%s.%03lld] [%.*s] %.*s\n", ts, static_cast<long long>(ms),
               static_cast<int>(levelName.size()), levelName.data(), static_cast<int>(msg.size()),
               msg.data());
}

void ConsoleLogger::setMinLevel(LogLevel level)
{
  std::lock_guard lock(_mutex);
  _minLevel = level;
}

LogLevel ConsoleLogger::minLevel() const
{
  std::lock_guard lock(_mutex);
  return _minLevel;
}

}  // namespace pricebase

#pragma once

#include <sstream>

#include "pricebase/log/abstract_logger.h"

namespace pricebase
{

class ConsoleLogger;

/// The stderr logger used when no other sink is installed.
ConsoleLogger& consoleLogger();

/// Process-wide log sink. Defaults to a ConsoleLogger on stderr.
ILogger& logger();

/// Routes all LogStream output to `sink`; nullptr restores the console logger.
/// The sink must outlive every subsequent log call.
void setLogger(ILogger* sink);

class LogStream
{
 public:
  explicit LogStream(LogLevel level = LogLevel::Info);
  ~LogStream();

  LogStream(const LogStream&) = delete;
  LogStream& operator=(const LogStream&) = delete;

  template <typename T>
  LogStream& operator<<(const T& val)
  {
    _stream << val;
    return *this;
  }

 private:
  LogLevel _level;
  std::ostringstream _stream;
};

}  // namespace pricebase

#define PRICEBASE_LOG_DEBUG ::pricebase::LogStream(::pricebase::LogLevel::Debug)
#define PRICEBASE_LOG_INFO ::pricebase::LogStream(::pricebase::LogLevel::Info)
#define PRICEBASE_LOG_WARN ::pricebase::LogStream(::pricebase::LogLevel::Warn)
#define PRICEBASE_LOG_ERROR ::pricebase::LogStream(::pricebase::LogLevel::Error)

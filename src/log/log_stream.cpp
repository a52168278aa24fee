#include "pricebase/log/log_stream.h"
#include "pricebase/log/console_logger.h"

#include <atomic>

namespace pricebase
{

namespace
{

std::atomic<ILogger*> g_sink{nullptr};

}  // namespace

ConsoleLogger& consoleLogger()
{
  static ConsoleLogger logger;
  return logger;
}

ILogger& logger()
{
  ILogger* sink = g_sink.load(std::memory_order_acquire);
  return sink ? *sink : consoleLogger();
}

void setLogger(ILogger* sink)
{
  g_sink.store(sink, std::memory_order_release);
}

LogStream::LogStream(LogLevel level) : _level(level) {}

LogStream::~LogStream()
{
  logger().log(_level, _stream.str());
}

}  // namespace pricebase

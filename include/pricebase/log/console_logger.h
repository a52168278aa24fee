#pragma once

#include <mutex>
#include <string_view>

#include "pricebase/log/abstract_logger.h"

namespace pricebase
{

class ConsoleLogger final : public ILogger
{
 public:
  explicit ConsoleLogger(LogLevel minLevel = LogLevel::Info);

  void log(LogLevel level, std::string_view msg) override;

  void setMinLevel(LogLevel level);
  LogLevel minLevel() const;

 private:
  mutable std::mutex _mutex;
  LogLevel _minLevel;
};

}  // namespace pricebase

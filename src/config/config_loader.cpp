/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/config/config_loader.h"
#include "pricebase/error.h"

#include <charconv>
#include <fstream>
#include <functional>
#include <istream>
#include <string>
#include <string_view>
#include <unordered_map>

namespace pricebase
{

namespace
{

std::string_view trim(std::string_view text)
{
  const auto first = text.find_first_not_of(" \t\r");
  if (first == std::string_view::npos)
  {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r");
  return text.substr(first, last - first + 1);
}

int64_t parseInt(std::string_view value, int64_t min)
{
  int64_t out = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  if (ec != std::errc() || ptr != value.data() + value.size())
  {
    throw InvalidArgumentError("'" + std::string(value) + "' is not an integer");
  }
  if (out < min)
  {
    throw InvalidArgumentError("'" + std::string(value) + "' must be at least " +
                               std::to_string(min));
  }
  return out;
}

double parseDouble(std::string_view value)
{
  size_t consumed = 0;
  double out = 0.0;
  try
  {
    out = std::stod(std::string(value), &consumed);
  }
  catch (const std::logic_error&)
  {
    consumed = 0;
  }
  if (consumed == 0 || consumed != value.size())
  {
    throw InvalidArgumentError("'" + std::string(value) + "' is not a number");
  }
  return out;
}

using Setter = std::function<void(PriceBaseConfig&, std::string_view)>;

const std::unordered_map<std::string_view, Setter>& setters()
{
  static const std::unordered_map<std::string_view, Setter> table = {
      {"data_dir", [](PriceBaseConfig& c, std::string_view v) { c.dataDir = std::string(v); }},
      {"log_level",
       [](PriceBaseConfig& c, std::string_view v)
       {
         if (!parseLogLevel(v, c.logLevel))
         {
           throw InvalidArgumentError("unknown log level '" + std::string(v) + "'");
         }
       }},
      {"store.query_page_size",
       [](PriceBaseConfig& c, std::string_view v)
       { c.store.queryPageSize = static_cast<size_t>(parseInt(v, 1)); }},
      {"store.tick_retention_minutes",
       [](PriceBaseConfig& c, std::string_view v)
       { c.store.tickRetention = std::chrono::minutes(parseInt(v, 0)); }},
      {"aggregator.interval_minutes",
       [](PriceBaseConfig& c, std::string_view v)
       { c.aggregator.intervalMinutes = static_cast<uint32_t>(parseInt(v, 1)); }},
      {"aggregator.grace_seconds",
       [](PriceBaseConfig& c, std::string_view v)
       { c.aggregator.gracePeriod = std::chrono::seconds(parseInt(v, 0)); }},
      {"aggregator.late_policy",
       [](PriceBaseConfig& c, std::string_view v)
       {
         if (v == "reject")
         {
           c.aggregator.latePolicy = LateTickPolicy::Reject;
         }
         else if (v == "drop")
         {
           c.aggregator.latePolicy = LateTickPolicy::Drop;
         }
         else
         {
           throw InvalidArgumentError("late policy must be 'reject' or 'drop', got '" +
                                      std::string(v) + "'");
         }
       }},
      {"aggregator.finalized_retention_minutes",
       [](PriceBaseConfig& c, std::string_view v)
       { c.aggregator.finalizedRetention = std::chrono::minutes(parseInt(v, 0)); }},
      {"indicator.min_periods",
       [](PriceBaseConfig& c, std::string_view v)
       { c.indicator.minPeriods = static_cast<size_t>(parseInt(v, 1)); }},
      {"indicator.window",
       [](PriceBaseConfig& c, std::string_view v)
       { c.indicator.defaultWindow = static_cast<size_t>(parseInt(v, 1)); }},
      {"pipeline.queue_capacity",
       [](PriceBaseConfig& c, std::string_view v)
       { c.pipeline.queueCapacity = static_cast<size_t>(parseInt(v, 1)); }},
      {"pipeline.workers",
       [](PriceBaseConfig& c, std::string_view v)
       { c.pipeline.workerCount = static_cast<size_t>(parseInt(v, 1)); }},
      {"retry.max_attempts",
       [](PriceBaseConfig& c, std::string_view v)
       { c.pipeline.retry.maxAttempts = static_cast<uint32_t>(parseInt(v, 1)); }},
      {"retry.initial_delay_ms",
       [](PriceBaseConfig& c, std::string_view v)
       { c.pipeline.retry.initialDelay = std::chrono::milliseconds(parseInt(v, 0)); }},
      {"retry.multiplier",
       [](PriceBaseConfig& c, std::string_view v)
       {
         const double m = parseDouble(v);
         if (m < 1.0)
         {
           throw InvalidArgumentError("retry multiplier must be at least 1");
         }
         c.pipeline.retry.multiplier = m;
       }},
      {"retry.max_delay_ms",
       [](PriceBaseConfig& c, std::string_view v)
       { c.pipeline.retry.maxDelay = std::chrono::milliseconds(parseInt(v, 0)); }},
  };
  return table;
}

}  // namespace

PriceBaseConfig parseConfig(std::istream& in)
{
  PriceBaseConfig config;
  std::string line;
  size_t lineNo = 0;
  while (std::getline(in, line))
  {
    ++lineNo;
    const auto text = trim(line);
    if (text.empty() || text.front() == '#')
    {
      continue;
    }

    const auto pos = text.find('=');
    if (pos == std::string_view::npos)
    {
      throw InvalidArgumentError("config line " + std::to_string(lineNo) + ": expected key=value");
    }

    const auto key = trim(text.substr(0, pos));
    const auto value = trim(text.substr(pos + 1));
    auto it = setters().find(key);
    if (it == setters().end())
    {
      throw InvalidArgumentError("config line " + std::to_string(lineNo) + ": unknown key '" +
                                 std::string(key) + "'");
    }

    try
    {
      it->second(config, value);
    }
    catch (const InvalidArgumentError& e)
    {
      throw InvalidArgumentError("config line " + std::to_string(lineNo) + " (" +
                                 std::string(key) + "): " + e.what());
    }
  }
  return config;
}

PriceBaseConfig loadConfig(const std::filesystem::path& path)
{
  std::ifstream in(path);
  if (!in)
  {
    throw NotFoundError("cannot open config file " + path.string());
  }
  return parseConfig(in);
}

}  // namespace pricebase

/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/storage/partition.h"
#include "pricebase/error.h"

#include <charconv>
#include <limits>
#include <vector>

namespace pricebase
{

TimePoint alignToInterval(TimePoint ts, uint32_t intervalMinutes) noexcept
{
  const int64_t step = intervalNs(intervalMinutes);
  if (step <= 0)
  {
    return ts;
  }

  const int64_t ns = toUnixNs(ts);
  int64_t snapped = (ns / step) * step;
  if (snapped > ns)
  {
    snapped -= step;
  }
  return fromUnixNs(snapped);
}

std::string partitionName(const Market& market, uint32_t intervalMinutes)
{
  std::string name = "PriceData_" + market.exchange + "_" + market.base + "_" + market.quote + "_";
  if (intervalMinutes == kTickInterval)
  {
    name += "tick";
  }
  else
  {
    name += std::to_string(intervalMinutes) + "mins";
  }
  return name;
}

std::optional<ParsedPartitionName> parsePartitionName(std::string_view name)
{
  constexpr std::string_view kPrefix = "PriceData_";
  if (name.substr(0, kPrefix.size()) != kPrefix)
  {
    return std::nullopt;
  }

  std::vector<std::string_view> parts;
  size_t start = 0;
  for (size_t i = 0; i <= name.size(); ++i)
  {
    if (i == name.size() || name[i] == '_')
    {
      parts.push_back(name.substr(start, i - start));
      start = i + 1;
    }
  }

  if (parts.size() != 5 || parts[1].empty() || parts[2].empty() || parts[3].empty())
  {
    throw InvalidArgumentError("malformed partition name '" + std::string(name) + "'");
  }

  ParsedPartitionName parsed;
  parsed.exchange = std::string(parts[1]);
  parsed.base = std::string(parts[2]);
  parsed.quote = std::string(parts[3]);

  const auto interval = parts[4];
  if (interval == "tick")
  {
    parsed.intervalMinutes = kTickInterval;
    return parsed;
  }

  constexpr std::string_view kSuffix = "mins";
  if (interval.size() <= kSuffix.size() ||
      interval.substr(interval.size() - kSuffix.size()) != kSuffix)
  {
    throw InvalidArgumentError("malformed interval in partition name '" + std::string(name) + "'");
  }

  const auto digits = interval.substr(0, interval.size() - kSuffix.size());
  int64_t minutes = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), minutes);
  if (ec != std::errc() || ptr != digits.data() + digits.size())
  {
    throw InvalidArgumentError("malformed interval in partition name '" + std::string(name) + "'");
  }
  if (minutes <= 0)
  {
    throw InvalidArgumentError("non-positive minute interval (" + std::to_string(minutes) +
                               ") in partition name '" + std::string(name) + "'");
  }
  if (minutes > std::numeric_limits<uint32_t>::max())
  {
    throw InvalidArgumentError("minute interval " + std::to_string(minutes) +
                               " is too large in partition name '" + std::string(name) + "'");
  }

  parsed.intervalMinutes = static_cast<uint32_t>(minutes);
  return parsed;
}

}  // namespace pricebase

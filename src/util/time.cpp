/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/util/base/time.h"

#include <charconv>
#include <cstdio>

namespace pricebase
{

namespace
{

// Howard Hinnant's civil calendar conversions (proleptic Gregorian).
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d)
{
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t z, int64_t& y, unsigned& m, unsigned& d)
{
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  y = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y += m <= 2;
}

bool parseFixed(std::string_view text, size_t pos, size_t len, int& out)
{
  if (pos + len > text.size())
  {
    return false;
  }
  const char* first = text.data() + pos;
  const char* last = first + len;
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

}  // namespace

std::string formatUtc(TimePoint tp)
{
  const int64_t secs = toUnixSeconds(tp);
  int64_t days = secs / 86400;
  int64_t rem = secs % 86400;
  if (rem < 0)
  {
    rem += 86400;
    --days;
  }

  int64_t y = 0;
  unsigned m = 0;
  unsigned d = 0;
  civilFromDays(days, y, m, d);

  char buf[48];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02lld:%02lld:%02lld+00",
                static_cast<long long>(y), m, d, static_cast<long long>(rem / 3600),
                static_cast<long long>((rem % 3600) / 60), static_cast<long long>(rem % 60));
  return buf;
}

std::optional<TimePoint> parseUtc(std::string_view text)
{
  while (!text.empty() && (text.front() == ' ' || text.front() == '"'))
  {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '"' || text.back() == '\r'))
  {
    text.remove_suffix(1);
  }
  if (text.empty())
  {
    return std::nullopt;
  }

  // Plain Unix seconds
  if (text.find('-', 1) == std::string_view::npos)
  {
    int64_t secs = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), secs);
    if (ec != std::errc() || ptr != text.data() + text.size())
    {
      return std::nullopt;
    }
    return fromUnixSeconds(secs);
  }

  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (text.size() < 19 || text[4] != '-' || text[7] != '-' || (text[10] != ' ' && text[10] != 'T') ||
      text[13] != ':' || text[16] != ':')
  {
    return std::nullopt;
  }
  if (!parseFixed(text, 0, 4, year) || !parseFixed(text, 5, 2, month) ||
      !parseFixed(text, 8, 2, day) || !parseFixed(text, 11, 2, hour) ||
      !parseFixed(text, 14, 2, minute) || !parseFixed(text, 17, 2, second))
  {
    return std::nullopt;
  }

  auto suffix = text.substr(19);
  if (!suffix.empty() && suffix != "Z" && suffix != "+00" && suffix != "+00:00")
  {
    return std::nullopt;
  }

  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
  {
    return std::nullopt;
  }

  const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  return fromUnixSeconds(days * 86400 + hour * 3600 + minute * 60 + second);
}

}  // namespace pricebase

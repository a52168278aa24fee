/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/error.h"

#include <algorithm>
#include <cmath>
#include <compare>
#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace pricebase
{

/// Fixed-point decimal with `Scale` units per integer step.
/// The persisted column contract is NUMERIC(24, 8); raw values are held in
/// int64 so the representable range is +/- 92,233,720,368.54775807.
template <typename Tag, int64_t Scale_ = 100'000'000>
class Decimal
{
 public:
  static constexpr int64_t Scale = Scale_;
  static constexpr int kFractionDigits = 8;

  static_assert(Scale_ == 100'000'000, "only 8 fractional digits are supported");

  constexpr Decimal() = default;

  static constexpr Decimal fromRaw(int64_t raw) noexcept
  {
    Decimal d;
    d._raw = raw;
    return d;
  }

  static constexpr int64_t kMaxRaw = std::numeric_limits<int64_t>::max();
  static constexpr int64_t kMinRaw = std::numeric_limits<int64_t>::min();

  /// Throws InvalidArgumentError when value * Scale does not fit the raw range.
  static constexpr Decimal fromInt(int64_t value)
  {
    if (value > kMaxRaw / Scale || value < kMinRaw / Scale)
    {
      throw InvalidArgumentError("decimal value " + std::to_string(value) + " is out of range");
    }
    return fromRaw(value * Scale);
  }

  static Decimal fromDouble(double value) noexcept
  {
    return fromRaw(static_cast<int64_t>(std::llround(value * static_cast<double>(Scale))));
  }

  /// Parses "[-+]digits[.digits]". Digits past the 8th fractional one are
  /// rounded half away from zero. Returns nullopt on malformed input or overflow.
  static std::optional<Decimal> parse(std::string_view text) noexcept
  {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
    {
      text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r'))
    {
      text.remove_suffix(1);
    }
    if (text.empty())
    {
      return std::nullopt;
    }

    bool negative = false;
    if (text.front() == '-' || text.front() == '+')
    {
      negative = text.front() == '-';
      text.remove_prefix(1);
    }

    __int128 value = 0;
    size_t i = 0;
    size_t intDigits = 0;
    for (; i < text.size() && text[i] != '.'; ++i)
    {
      const char c = text[i];
      if (c < '0' || c > '9')
      {
        return std::nullopt;
      }
      value = value * 10 + (c - '0');
      ++intDigits;
      if (value > static_cast<__int128>(std::numeric_limits<int64_t>::max()))
      {
        return std::nullopt;
      }
    }

    size_t fracDigits = 0;
    bool roundUp = false;
    if (i < text.size())
    {
      ++i;  // skip '.'
      for (; i < text.size(); ++i)
      {
        const char c = text[i];
        if (c < '0' || c > '9')
        {
          return std::nullopt;
        }
        if (fracDigits < static_cast<size_t>(kFractionDigits))
        {
          value = value * 10 + (c - '0');
          ++fracDigits;
        }
        else if (fracDigits == static_cast<size_t>(kFractionDigits))
        {
          roundUp = c >= '5';
          ++fracDigits;
        }
      }
    }

    if (intDigits == 0 && fracDigits == 0)
    {
      return std::nullopt;
    }

    for (size_t k = std::min<size_t>(fracDigits, kFractionDigits); k < static_cast<size_t>(kFractionDigits); ++k)
    {
      value *= 10;
    }
    if (roundUp)
    {
      value += 1;
    }
    if (value > static_cast<__int128>(std::numeric_limits<int64_t>::max()))
    {
      return std::nullopt;
    }

    const auto raw = static_cast<int64_t>(value);
    return fromRaw(negative ? -raw : raw);
  }

  constexpr int64_t raw() const noexcept { return _raw; }
  double toDouble() const noexcept { return static_cast<double>(_raw) / static_cast<double>(Scale); }

  /// Canonical text form with all 8 fractional digits, e.g. "100.00000000".
  std::string toString() const
  {
    const bool negative = _raw < 0;
    const auto mag = negative ? -static_cast<__int128>(_raw) : static_cast<__int128>(_raw);
    const auto whole = static_cast<uint64_t>(mag / Scale);
    auto frac = static_cast<uint64_t>(mag % Scale);

    char fracBuf[kFractionDigits];
    for (int k = kFractionDigits - 1; k >= 0; --k)
    {
      fracBuf[k] = static_cast<char>('0' + frac % 10);
      frac /= 10;
    }

    std::string out;
    if (negative)
    {
      out.push_back('-');
    }
    out += std::to_string(whole);
    out.push_back('.');
    out.append(fracBuf, kFractionDigits);
    return out;
  }

  constexpr bool isZero() const noexcept { return _raw == 0; }
  constexpr bool isPositive() const noexcept { return _raw > 0; }
  constexpr bool isNegative() const noexcept { return _raw < 0; }

  constexpr Decimal operator+(Decimal other) const noexcept { return fromRaw(_raw + other._raw); }
  constexpr Decimal operator-(Decimal other) const noexcept { return fromRaw(_raw - other._raw); }
  constexpr Decimal operator-() const noexcept { return fromRaw(-_raw); }

  constexpr Decimal& operator+=(Decimal other) noexcept
  {
    _raw += other._raw;
    return *this;
  }

  constexpr Decimal& operator-=(Decimal other) noexcept
  {
    _raw -= other._raw;
    return *this;
  }

  constexpr auto operator<=>(const Decimal&) const = default;

 private:
  int64_t _raw{0};
};

template <typename Tag, int64_t Scale>
inline std::ostream& operator<<(std::ostream& os, Decimal<Tag, Scale> value)
{
  return os << value.toString();
}

}  // namespace pricebase

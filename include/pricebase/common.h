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
#include "pricebase/util/base/decimal.h"
#include "pricebase/util/base/time.h"

#include <cstdint>
#include <limits>
#include <string>

namespace pricebase
{

using MarketId = uint32_t;
using SessionId = uint64_t;

static constexpr MarketId InvalidMarketId = 0;
static constexpr SessionId InvalidSessionId = 0;

struct PriceTag
{
};
struct QuantityTag
{
};
struct AmountTag
{
};

// tick = 0.00000001 (8 decimals)
using Price = Decimal<PriceTag>;
using Quantity = Decimal<QuantityTag>;
using Amount = Decimal<AmountTag>;

// Traded volume is measured in units of the quoted asset.
using Volume = Quantity;

namespace detail
{

// Narrows a 128-bit intermediate back to a raw decimal value
inline int64_t checkedRaw(__int128 value, const char* what)
{
  if (value > static_cast<__int128>(std::numeric_limits<int64_t>::max()) ||
      value < static_cast<__int128>(std::numeric_limits<int64_t>::min()))
  {
    throw InvalidArgumentError(std::string(what) + " is out of the decimal range");
  }
  return static_cast<int64_t>(value);
}

// round(n / d), halves away from zero
inline int64_t divRoundNearest(__int128 n, __int128 d)
{
  const __int128 half = d / 2;
  const __int128 q = (n >= 0) ? (n + half) / d : (n - half) / d;
  return checkedRaw(q, "rounded quotient");
}

}  // namespace detail

/// Throws InvalidArgumentError when the product exceeds the Amount range.
inline Amount operator*(Price px, Quantity qty)
{
  using i128 = __int128;
  const i128 product = (i128)px.raw() * (i128)qty.raw();
  const i128 half = Amount::Scale / 2;
  const i128 q = (product >= 0) ? (product + half) / Amount::Scale
                                : (product - half) / Amount::Scale;
  return Amount::fromRaw(detail::checkedRaw(q, "price * quantity"));
}

inline Amount operator*(Quantity qty, Price px)
{
  return px * qty;
}

/// Truncates toward zero. Throws InvalidArgumentError for a zero price or an
/// out-of-range quotient.
inline Quantity operator/(Amount amount, Price px)
{
  using i128 = __int128;
  if (px.isZero())
  {
    throw InvalidArgumentError("division by a zero price");
  }
  return Quantity::fromRaw(
      detail::checkedRaw((i128)amount.raw() * (i128)Quantity::Scale / (i128)px.raw(),
                         "amount / price"));
}

}  // namespace pricebase

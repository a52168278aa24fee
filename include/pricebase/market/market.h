/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/common.h"

#include <string>
#include <string_view>

namespace pricebase
{

/// A tradable pair on one exchange. `base` is the currency prices are quoted
/// in and sessions are funded with, `quote` the traded asset
/// (PriceData_Bitstamp_USD_BTC: one BTC priced in USD).
struct Market
{
  MarketId id{InvalidMarketId};
  std::string base;
  std::string quote;
  std::string exchange;
  bool active{true};

  // Identity is the normalized (base, quote, exchange) triple
  bool operator==(const Market& other) const noexcept
  {
    return base == other.base && quote == other.quote && exchange == other.exchange;
  }

  std::string displayName() const { return exchange + ":" + base + "/" + quote; }
};

/// Trims whitespace and upper-cases. Throws InvalidSymbolError when the result
/// is empty or holds anything but letters, digits, '-' and '.'.
std::string normalizeCurrency(std::string_view symbol);

/// Trims whitespace and title-cases ("  bitFINEX" -> "Bitfinex"). Same
/// character rules as normalizeCurrency.
std::string normalizeExchange(std::string_view exchange);

}  // namespace pricebase

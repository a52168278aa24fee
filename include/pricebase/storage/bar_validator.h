/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/storage/records.h"

#include <optional>
#include <string>

namespace pricebase
{

/// Returns a description of the first schema violation, or nullopt when the
/// bar satisfies every constraint of its partition:
///   interval > 0, periodStart aligned to the interval and not after `now`,
///   low <= open, close <= high, volume > 0.
std::optional<std::string> checkBar(const OhlcvBar& bar, TimePoint now);

/// Tick constraints: volume > 0, timestamp not after `now`.
std::optional<std::string> checkTick(const PriceTick& tick, TimePoint now);

/// Throwing forms; raise InvalidBarError with the violation text.
void validateBar(const OhlcvBar& bar, TimePoint now);
void validateTick(const PriceTick& tick, TimePoint now);

}  // namespace pricebase

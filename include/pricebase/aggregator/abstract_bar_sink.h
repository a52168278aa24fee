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

namespace pricebase
{

/// Receives finalized bars. Throwing from onBar keeps the bucket open.
class IBarSink
{
 public:
  virtual ~IBarSink() = default;
  virtual void onBar(const OhlcvBar& bar) = 0;
};

}  // namespace pricebase

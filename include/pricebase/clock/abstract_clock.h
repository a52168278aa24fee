/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/util/base/time.h"

namespace pricebase
{

class IClock
{
 public:
  virtual ~IClock() = default;

  virtual UnixNanos nowNs() const = 0;

  TimePoint now() const { return fromUnixNs(nowNs()); }
};

}  // namespace pricebase

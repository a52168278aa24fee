/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/clock/abstract_clock.h"

#include <atomic>

namespace pricebase
{

class SimulatedClock : public IClock
{
 public:
  SimulatedClock() = default;
  explicit SimulatedClock(UnixNanos initial) : _current_ns(initial) {}
  explicit SimulatedClock(TimePoint initial) : _current_ns(toUnixNs(initial)) {}

  UnixNanos nowNs() const override { return _current_ns.load(std::memory_order_acquire); }

  // Never moves backwards
  void advanceTo(UnixNanos ns)
  {
    UnixNanos current = _current_ns.load(std::memory_order_relaxed);
    while (ns > current &&
           !_current_ns.compare_exchange_weak(current, ns, std::memory_order_acq_rel))
    {
    }
  }

  void advanceTo(TimePoint tp) { advanceTo(toUnixNs(tp)); }

  void advanceBy(std::chrono::nanoseconds delta)
  {
    _current_ns.fetch_add(delta.count(), std::memory_order_acq_rel);
  }

  void reset(UnixNanos ns = 0) { _current_ns.store(ns, std::memory_order_release); }

 private:
  std::atomic<UnixNanos> _current_ns{0};
};

}  // namespace pricebase

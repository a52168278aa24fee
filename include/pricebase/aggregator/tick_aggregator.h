/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/aggregator/abstract_bar_sink.h"
#include "pricebase/aggregator/aggregate.h"
#include "pricebase/clock/abstract_clock.h"
#include "pricebase/config/engine_config.h"

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace pricebase
{

enum class TickOutcome : uint8_t
{
  Accepted,
  Dropped  ///< late tick discarded under LateTickPolicy::Drop
};

enum class FinalizeResult : uint8_t
{
  Finalized,
  Cancelled,  ///< stop requested; the bucket stays open
  NoBucket
};

/**
 * Streaming tick -> bar aggregation at one interval.
 *
 * Buckets stay open until finalized explicitly or until their end plus the
 * grace period has passed on the injected clock. Finalizing hands the bar to
 * the sink outside the aggregator lock, so other buckets keep accepting ticks
 * while it runs; ticks and finalizers for the bucket being emitted wait for
 * the outcome. When the sink throws a retryable error the bucket stays open,
 * other errors retire it.
 *
 * A tick for an already finalized bucket is rejected with ConflictError or
 * dropped, depending on AggregatorConfig::latePolicy. Finalized buckets are
 * forgotten once finalizedRetention has passed after their deadline.
 */
class TickAggregator
{
 public:
  TickAggregator(IBarSink& sink, const IClock& clock, AggregatorConfig config = {});

  /// Throws InvalidBarError for ticks that fail validation.
  TickOutcome onTick(const PriceTick& tick);

  /// False when no bucket is open at (market, periodStart).
  bool finalize(MarketId market, TimePoint periodStart);

  /// Finalizes every bucket whose grace period has elapsed and forgets
  /// finalized buckets past their retention.
  size_t finalizeExpired();

  size_t finalizeAll();

  /// Blocks until the grace deadline of the bucket passes, then finalizes it.
  /// The deadline is re-checked against the clock at least every
  /// kMaxWaitSlice and whenever wake() is called.
  FinalizeResult awaitAndFinalize(MarketId market, TimePoint periodStart, std::stop_token stop);

  /// Wakes waiters so they re-read the clock.
  void wake();

  std::optional<OhlcvBar> peek(MarketId market, TimePoint periodStart) const;
  size_t openBuckets() const;
  bool isFinalized(MarketId market, TimePoint periodStart) const;

  /// Buckets retired so far, including those the sink rejected.
  size_t finalizedCount() const;

  /// Finalized buckets still remembered for late-tick checks.
  size_t rememberedFinalized() const;

  TimePoint deadlineFor(TimePoint periodStart) const;

  const AggregatorConfig& config() const { return _config; }

  static constexpr std::chrono::milliseconds kMaxWaitSlice{50};

 private:
  using BucketKey = std::pair<MarketId, UnixNanos>;

  struct Bucket
  {
    Bucket(MarketId market, uint32_t intervalMinutes, TimePoint periodStart)
        : acc(market, intervalMinutes, periodStart)
    {
    }

    BarAccumulator acc;
    bool emitting{false};  // the sink is running for this bucket
  };

  using BucketMap = std::map<BucketKey, Bucket>;

  // Called with `lock` held on a bucket that is not emitting; the lock is
  // released around the sink call and held again on return or throw.
  void emit(std::unique_lock<std::mutex>& lock, BucketMap::iterator it);
  void retireLocked(BucketMap::iterator it);
  void waitWhileEmitting(std::unique_lock<std::mutex>& lock, const BucketKey& key);
  void pruneFinalizedLocked(TimePoint now);

  IBarSink& _sink;
  const IClock& _clock;
  AggregatorConfig _config;

  mutable std::mutex _mutex;
  std::condition_variable_any _cv;
  uint64_t _wakeups{0};
  BucketMap _buckets;
  std::map<BucketKey, TimePoint> _finalized;  // key -> grace deadline
  size_t _finalizedTotal{0};
};

}  // namespace pricebase

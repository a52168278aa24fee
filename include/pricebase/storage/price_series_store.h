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
#include "pricebase/clock/abstract_clock.h"
#include "pricebase/config/engine_config.h"
#include "pricebase/storage/abstract_storage_backend.h"
#include "pricebase/storage/bar_range.h"

#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace pricebase
{

enum class IngestOutcome : uint8_t
{
  Inserted,
  Unchanged  ///< identical bar already stored
};

/**
 * Validating front of a storage backend, partitioned by (market, interval).
 *
 * Writes to one partition are serialized by a partition-local mutex so the
 * find/compare/insert sequence of ingestBar is atomic; writers to different
 * partitions never contend. Reads go straight to the backend.
 *
 * Storage failures propagate as StorageUnavailableError and are never retried
 * here.
 */
class PriceSeriesStore : public IBarSink
{
 public:
  PriceSeriesStore(IStorageBackend& backend, const IClock& clock, StoreConfig config = {});

  /// Throws InvalidBarError on a schema violation and ConflictError when a
  /// different bar is already stored under the same key.
  IngestOutcome ingestBar(const OhlcvBar& bar);

  /// Append-only; duplicates are kept.
  void ingestTick(const PriceTick& tick);

  void onBar(const OhlcvBar& bar) override { ingestBar(bar); }

  /// Throws InvalidArgumentError for a zero interval.
  BarRange queryRange(MarketId market, uint32_t intervalMinutes, TimePoint from,
                      TimePoint to) const;

  /// Latest bar with periodStart <= ts.
  std::optional<OhlcvBar> latestBefore(MarketId market, uint32_t intervalMinutes,
                                       TimePoint ts) const;

  std::vector<PriceTick> queryTicks(MarketId market, TimePoint from, TimePoint to) const;

  /// Drops ticks older than now - tickRetention from every tick partition.
  size_t purgeExpiredTicks();

  std::vector<PartitionKey> partitions() const { return _backend.partitions(); }
  void flush() { _backend.flush(); }

  const StoreConfig& config() const { return _config; }
  const IClock& clock() const { return _clock; }

 private:
  std::mutex& partitionLock(const PartitionKey& key);

  IStorageBackend& _backend;
  const IClock& _clock;
  StoreConfig _config;

  std::mutex _locksMutex;
  std::unordered_map<PartitionKey, std::unique_ptr<std::mutex>> _partitionLocks;
};

}  // namespace pricebase

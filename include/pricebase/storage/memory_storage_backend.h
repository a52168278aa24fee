/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/storage/abstract_storage_backend.h"

#include <map>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace pricebase
{

/// In-process backend used for backtests and tests.
class MemoryStorageBackend : public IStorageBackend
{
 public:
  std::optional<OhlcvBar> findBar(const PartitionKey& key, TimePoint periodStart) const override;
  void insertBar(const PartitionKey& key, const OhlcvBar& bar) override;
  std::vector<OhlcvBar> scanBars(const PartitionKey& key, TimePoint from, TimePoint to,
                                 size_t limit) const override;
  std::optional<OhlcvBar> latestBarAtOrBefore(const PartitionKey& key, TimePoint ts) const override;

  void appendTick(const PriceTick& tick) override;
  std::vector<PriceTick> scanTicks(MarketId market, TimePoint from, TimePoint to) const override;
  size_t purgeTicksBefore(MarketId market, TimePoint cutoff) override;

  std::vector<PartitionKey> partitions() const override;

  size_t barCount(const PartitionKey& key) const;
  size_t tickCount(MarketId market) const;

 private:
  struct BarPartition
  {
    mutable std::shared_mutex mutex;
    std::map<UnixNanos, OhlcvBar> bars;
  };

  struct TickPartition
  {
    mutable std::shared_mutex mutex;
    std::multimap<UnixNanos, PriceTick> ticks;
  };

  BarPartition* findBars(const PartitionKey& key) const;
  BarPartition& barsFor(const PartitionKey& key);
  TickPartition* findTicks(MarketId market) const;
  TickPartition& ticksFor(MarketId market);

  mutable std::shared_mutex _partitionsMutex;
  std::unordered_map<PartitionKey, std::unique_ptr<BarPartition>> _bars;
  std::unordered_map<MarketId, std::unique_ptr<TickPartition>> _ticks;
};

}  // namespace pricebase

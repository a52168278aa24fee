/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/storage/partition.h"
#include "pricebase/storage/records.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace pricebase
{

/// Durable store collaborator. Implementations must be safe for concurrent
/// use across partitions and make each inserted bar visible atomically.
/// I/O failures are reported as StorageUnavailableError.
class IStorageBackend
{
 public:
  virtual ~IStorageBackend() = default;

  virtual std::optional<OhlcvBar> findBar(const PartitionKey& key, TimePoint periodStart) const = 0;

  /// Inserts a bar whose key is not yet present. Callers check for collisions.
  virtual void insertBar(const PartitionKey& key, const OhlcvBar& bar) = 0;

  /// Bars with periodStart in [from, to], ascending, at most `limit` of them.
  virtual std::vector<OhlcvBar> scanBars(const PartitionKey& key, TimePoint from, TimePoint to,
                                         size_t limit) const = 0;

  /// Latest bar with periodStart <= ts.
  virtual std::optional<OhlcvBar> latestBarAtOrBefore(const PartitionKey& key,
                                                      TimePoint ts) const = 0;

  virtual void appendTick(const PriceTick& tick) = 0;

  /// Ticks with timestamp in [from, to], ordered by timestamp then arrival.
  virtual std::vector<PriceTick> scanTicks(MarketId market, TimePoint from, TimePoint to) const = 0;

  /// Removes ticks with timestamp < cutoff; returns how many were removed.
  virtual size_t purgeTicksBefore(MarketId market, TimePoint cutoff) = 0;

  virtual std::vector<PartitionKey> partitions() const = 0;

  virtual void flush() {}
};

}  // namespace pricebase

/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/storage/memory_storage_backend.h"

#include <algorithm>
#include <iterator>
#include <mutex>

namespace pricebase
{

MemoryStorageBackend::BarPartition* MemoryStorageBackend::findBars(const PartitionKey& key) const
{
  std::shared_lock lock(_partitionsMutex);
  auto it = _bars.find(key);
  return it != _bars.end() ? it->second.get() : nullptr;
}

MemoryStorageBackend::BarPartition& MemoryStorageBackend::barsFor(const PartitionKey& key)
{
  if (auto* existing = findBars(key))
  {
    return *existing;
  }

  std::unique_lock lock(_partitionsMutex);
  auto& slot = _bars[key];
  if (!slot)
  {
    slot = std::make_unique<BarPartition>();
  }
  return *slot;
}

MemoryStorageBackend::TickPartition* MemoryStorageBackend::findTicks(MarketId market) const
{
  std::shared_lock lock(_partitionsMutex);
  auto it = _ticks.find(market);
  return it != _ticks.end() ? it->second.get() : nullptr;
}

MemoryStorageBackend::TickPartition& MemoryStorageBackend::ticksFor(MarketId market)
{
  if (auto* existing = findTicks(market))
  {
    return *existing;
  }

  std::unique_lock lock(_partitionsMutex);
  auto& slot = _ticks[market];
  if (!slot)
  {
    slot = std::make_unique<TickPartition>();
  }
  return *slot;
}

// =============================================================================
// Bars
// =============================================================================

std::optional<OhlcvBar> MemoryStorageBackend::findBar(const PartitionKey& key,
                                                      TimePoint periodStart) const
{
  const auto* partition = findBars(key);
  if (!partition)
  {
    return std::nullopt;
  }

  std::shared_lock lock(partition->mutex);
  auto it = partition->bars.find(toUnixNs(periodStart));
  if (it == partition->bars.end())
  {
    return std::nullopt;
  }
  return it->second;
}

void MemoryStorageBackend::insertBar(const PartitionKey& key, const OhlcvBar& bar)
{
  auto& partition = barsFor(key);
  std::unique_lock lock(partition.mutex);
  partition.bars.emplace(toUnixNs(bar.periodStart), bar);
}

std::vector<OhlcvBar> MemoryStorageBackend::scanBars(const PartitionKey& key, TimePoint from,
                                                     TimePoint to, size_t limit) const
{
  std::vector<OhlcvBar> result;
  const auto* partition = findBars(key);
  if (!partition || from > to || limit == 0)
  {
    return result;
  }

  std::shared_lock lock(partition->mutex);
  auto it = partition->bars.lower_bound(toUnixNs(from));
  auto end = partition->bars.upper_bound(toUnixNs(to));
  for (; it != end && result.size() < limit; ++it)
  {
    result.push_back(it->second);
  }
  return result;
}

std::optional<OhlcvBar> MemoryStorageBackend::latestBarAtOrBefore(const PartitionKey& key,
                                                                  TimePoint ts) const
{
  const auto* partition = findBars(key);
  if (!partition)
  {
    return std::nullopt;
  }

  std::shared_lock lock(partition->mutex);
  auto it = partition->bars.upper_bound(toUnixNs(ts));
  if (it == partition->bars.begin())
  {
    return std::nullopt;
  }
  return std::prev(it)->second;
}

size_t MemoryStorageBackend::barCount(const PartitionKey& key) const
{
  const auto* partition = findBars(key);
  if (!partition)
  {
    return 0;
  }
  std::shared_lock lock(partition->mutex);
  return partition->bars.size();
}

// =============================================================================
// Ticks
// =============================================================================

void MemoryStorageBackend::appendTick(const PriceTick& tick)
{
  auto& partition = ticksFor(tick.market);
  std::unique_lock lock(partition.mutex);
  // multimap keeps equal keys in insertion order
  partition.ticks.emplace(toUnixNs(tick.timestamp), tick);
}

std::vector<PriceTick> MemoryStorageBackend::scanTicks(MarketId market, TimePoint from,
                                                       TimePoint to) const
{
  std::vector<PriceTick> result;
  const auto* partition = findTicks(market);
  if (!partition || from > to)
  {
    return result;
  }

  std::shared_lock lock(partition->mutex);
  auto it = partition->ticks.lower_bound(toUnixNs(from));
  auto end = partition->ticks.upper_bound(toUnixNs(to));
  for (; it != end; ++it)
  {
    result.push_back(it->second);
  }
  return result;
}

size_t MemoryStorageBackend::purgeTicksBefore(MarketId market, TimePoint cutoff)
{
  auto* partition = findTicks(market);
  if (!partition)
  {
    return 0;
  }

  std::unique_lock lock(partition->mutex);
  auto end = partition->ticks.lower_bound(toUnixNs(cutoff));
  const auto removed = static_cast<size_t>(std::distance(partition->ticks.begin(), end));
  partition->ticks.erase(partition->ticks.begin(), end);
  return removed;
}

size_t MemoryStorageBackend::tickCount(MarketId market) const
{
  const auto* partition = findTicks(market);
  if (!partition)
  {
    return 0;
  }
  std::shared_lock lock(partition->mutex);
  return partition->ticks.size();
}

std::vector<PartitionKey> MemoryStorageBackend::partitions() const
{
  std::shared_lock lock(_partitionsMutex);
  std::vector<PartitionKey> keys;
  keys.reserve(_bars.size() + _ticks.size());
  for (const auto& [key, _] : _bars)
  {
    keys.push_back(key);
  }
  for (const auto& [market, _] : _ticks)
  {
    keys.push_back(PartitionKey{market, kTickInterval});
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

}  // namespace pricebase

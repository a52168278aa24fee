/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/storage/price_series_store.h"
#include "pricebase/error.h"
#include "pricebase/log/log_stream.h"
#include "pricebase/storage/bar_validator.h"

#include <string>

namespace pricebase
{

namespace
{

std::string describe(const OhlcvBar& bar)
{
  return "O=" + bar.open.toString() + " H=" + bar.high.toString() + " L=" + bar.low.toString() +
         " C=" + bar.close.toString() + " V=" + bar.volume.toString();
}

}  // namespace

PriceSeriesStore::PriceSeriesStore(IStorageBackend& backend, const IClock& clock,
                                   StoreConfig config)
    : _backend(backend), _clock(clock), _config(config)
{
  if (_config.queryPageSize == 0)
  {
    throw InvalidArgumentError("query page size must be positive");
  }
  if (_config.tickRetention.count() < 0)
  {
    throw InvalidArgumentError("tick retention must not be negative");
  }
}

std::mutex& PriceSeriesStore::partitionLock(const PartitionKey& key)
{
  std::scoped_lock lock(_locksMutex);
  auto& slot = _partitionLocks[key];
  if (!slot)
  {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

IngestOutcome PriceSeriesStore::ingestBar(const OhlcvBar& bar)
{
  validateBar(bar, _clock.now());

  const PartitionKey key{bar.market, bar.intervalMinutes};
  std::scoped_lock lock(partitionLock(key));

  if (auto existing = _backend.findBar(key, bar.periodStart))
  {
    if (existing->samePayload(bar))
    {
      return IngestOutcome::Unchanged;
    }
    throw ConflictError("bar at " + formatUtc(bar.periodStart) + " already stored as " +
                        describe(*existing) + ", refusing " + describe(bar));
  }

  _backend.insertBar(key, bar);
  return IngestOutcome::Inserted;
}

void PriceSeriesStore::ingestTick(const PriceTick& tick)
{
  validateTick(tick, _clock.now());
  _backend.appendTick(tick);
}

BarRange PriceSeriesStore::queryRange(MarketId market, uint32_t intervalMinutes, TimePoint from,
                                      TimePoint to) const
{
  if (intervalMinutes == 0)
  {
    throw InvalidArgumentError("bar queries need a positive interval");
  }
  return BarRange(_backend, PartitionKey{market, intervalMinutes}, from, to,
                  _config.queryPageSize);
}

std::optional<OhlcvBar> PriceSeriesStore::latestBefore(MarketId market, uint32_t intervalMinutes,
                                                       TimePoint ts) const
{
  if (intervalMinutes == 0)
  {
    throw InvalidArgumentError("bar queries need a positive interval");
  }
  return _backend.latestBarAtOrBefore(PartitionKey{market, intervalMinutes}, ts);
}

std::vector<PriceTick> PriceSeriesStore::queryTicks(MarketId market, TimePoint from,
                                                    TimePoint to) const
{
  return _backend.scanTicks(market, from, to);
}

size_t PriceSeriesStore::purgeExpiredTicks()
{
  if (_config.tickRetention.count() == 0)
  {
    return 0;
  }

  const TimePoint cutoff = _clock.now() - _config.tickRetention;
  size_t removed = 0;
  for (const auto& key : _backend.partitions())
  {
    if (key.isTick())
    {
      removed += _backend.purgeTicksBefore(key.market, cutoff);
    }
  }

  if (removed > 0)
  {
    PRICEBASE_LOG_INFO << "purged " << removed << " ticks older than " << formatUtc(cutoff);
  }
  return removed;
}

}  // namespace pricebase

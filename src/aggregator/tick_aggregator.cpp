/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/aggregator/tick_aggregator.h"
#include "pricebase/error.h"
#include "pricebase/log/log_stream.h"
#include "pricebase/storage/bar_validator.h"
#include "pricebase/storage/partition.h"

#include <algorithm>
#include <vector>

namespace pricebase
{

TickAggregator::TickAggregator(IBarSink& sink, const IClock& clock, AggregatorConfig config)
    : _sink(sink), _clock(clock), _config(config)
{
  if (_config.intervalMinutes == 0)
  {
    throw InvalidArgumentError("aggregation interval must be positive");
  }
  if (_config.gracePeriod.count() < 0)
  {
    throw InvalidArgumentError("grace period must not be negative");
  }
}

TimePoint TickAggregator::deadlineFor(TimePoint periodStart) const
{
  return periodStart + std::chrono::nanoseconds(intervalNs(_config.intervalMinutes)) +
         _config.gracePeriod;
}

TickOutcome TickAggregator::onTick(const PriceTick& tick)
{
  validateTick(tick, _clock.now());

  const TimePoint start = alignToInterval(tick.timestamp, _config.intervalMinutes);
  const BucketKey key{tick.market, toUnixNs(start)};

  std::unique_lock lock(_mutex);
  waitWhileEmitting(lock, key);
  if (_finalized.contains(key))
  {
    if (_config.latePolicy == LateTickPolicy::Reject)
    {
      throw ConflictError("tick at " + formatUtc(tick.timestamp) +
                          " would change the finalized bar starting " + formatUtc(start));
    }
    PRICEBASE_LOG_WARN << "dropping late tick at " << formatUtc(tick.timestamp) << " for market "
                       << tick.market << ": bar " << formatUtc(start) << " is already finalized";
    return TickOutcome::Dropped;
  }

  auto [it, _] = _buckets.try_emplace(key, tick.market, _config.intervalMinutes, start);
  it->second.acc.add(tick);
  return TickOutcome::Accepted;
}

void TickAggregator::waitWhileEmitting(std::unique_lock<std::mutex>& lock, const BucketKey& key)
{
  _cv.wait(lock,
           [&]
           {
             auto it = _buckets.find(key);
             return it == _buckets.end() || !it->second.emitting;
           });
}

void TickAggregator::retireLocked(BucketMap::iterator it)
{
  _finalized[it->first] = deadlineFor(it->second.acc.bar().periodStart);
  ++_finalizedTotal;
  _buckets.erase(it);
  _cv.notify_all();
}

void TickAggregator::emit(std::unique_lock<std::mutex>& lock, BucketMap::iterator it)
{
  // Emitting buckets are never erased by other threads, so `it` stays valid
  const OhlcvBar bar = it->second.acc.bar();
  it->second.emitting = true;
  lock.unlock();

  try
  {
    _sink.onBar(bar);
  }
  catch (const Error& e)
  {
    lock.lock();
    if (e.retryable())
    {
      it->second.emitting = false;
      _cv.notify_all();
      throw;
    }
    PRICEBASE_LOG_ERROR << "bar " << formatUtc(bar.periodStart) << " for market " << bar.market
                        << " rejected by sink: " << e.what();
    retireLocked(it);
    throw;
  }
  catch (...)
  {
    lock.lock();
    it->second.emitting = false;
    _cv.notify_all();
    throw;
  }

  lock.lock();
  retireLocked(it);
}

void TickAggregator::pruneFinalizedLocked(TimePoint now)
{
  std::erase_if(_finalized, [&](const auto& entry)
                { return entry.second + _config.finalizedRetention <= now; });
}

bool TickAggregator::finalize(MarketId market, TimePoint periodStart)
{
  const BucketKey key{market, toUnixNs(periodStart)};

  std::unique_lock lock(_mutex);
  waitWhileEmitting(lock, key);
  auto it = _buckets.find(key);
  if (it == _buckets.end())
  {
    return false;
  }
  emit(lock, it);
  return true;
}

size_t TickAggregator::finalizeExpired()
{
  const TimePoint now = _clock.now();

  std::unique_lock lock(_mutex);
  std::vector<BucketKey> due;
  for (const auto& [key, bucket] : _buckets)
  {
    if (!bucket.emitting && deadlineFor(bucket.acc.bar().periodStart) <= now)
    {
      due.push_back(key);
    }
  }

  size_t count = 0;
  for (const auto& key : due)
  {
    // Another thread may have finalized it while the lock was released
    auto it = _buckets.find(key);
    if (it == _buckets.end() || it->second.emitting)
    {
      continue;
    }
    emit(lock, it);
    ++count;
  }

  pruneFinalizedLocked(now);
  return count;
}

size_t TickAggregator::finalizeAll()
{
  std::unique_lock lock(_mutex);
  size_t count = 0;
  while (!_buckets.empty())
  {
    auto it = std::find_if(_buckets.begin(), _buckets.end(),
                           [](const auto& entry) { return !entry.second.emitting; });
    if (it == _buckets.end())
    {
      // Only buckets owned by other emitters are left
      _cv.wait(lock);
      continue;
    }
    emit(lock, it);
    ++count;
  }
  return count;
}

FinalizeResult TickAggregator::awaitAndFinalize(MarketId market, TimePoint periodStart,
                                                std::stop_token stop)
{
  const BucketKey key{market, toUnixNs(periodStart)};
  const TimePoint deadline = deadlineFor(periodStart);

  std::unique_lock lock(_mutex);
  while (true)
  {
    auto it = _buckets.find(key);
    if (it == _buckets.end())
    {
      return _finalized.contains(key) ? FinalizeResult::Finalized : FinalizeResult::NoBucket;
    }
    if (stop.stop_requested())
    {
      return FinalizeResult::Cancelled;
    }

    if (it->second.emitting)
    {
      _cv.wait_for(lock, stop, kMaxWaitSlice,
                   [&]
                   {
                     auto current = _buckets.find(key);
                     return current == _buckets.end() || !current->second.emitting;
                   });
      continue;
    }

    const TimePoint now = _clock.now();
    if (now >= deadline)
    {
      emit(lock, it);
      return FinalizeResult::Finalized;
    }

    const auto slice = std::min<std::chrono::nanoseconds>(deadline - now, kMaxWaitSlice);
    const uint64_t seen = _wakeups;
    _cv.wait_for(lock, stop, slice, [&] { return _wakeups != seen; });
  }
}

void TickAggregator::wake()
{
  {
    std::scoped_lock lock(_mutex);
    ++_wakeups;
  }
  _cv.notify_all();
}

std::optional<OhlcvBar> TickAggregator::peek(MarketId market, TimePoint periodStart) const
{
  std::scoped_lock lock(_mutex);
  auto it = _buckets.find(BucketKey{market, toUnixNs(periodStart)});
  if (it == _buckets.end())
  {
    return std::nullopt;
  }
  return it->second.acc.bar();
}

size_t TickAggregator::openBuckets() const
{
  std::scoped_lock lock(_mutex);
  return _buckets.size();
}

bool TickAggregator::isFinalized(MarketId market, TimePoint periodStart) const
{
  std::scoped_lock lock(_mutex);
  return _finalized.contains(BucketKey{market, toUnixNs(periodStart)});
}

size_t TickAggregator::finalizedCount() const
{
  std::scoped_lock lock(_mutex);
  return _finalizedTotal;
}

size_t TickAggregator::rememberedFinalized() const
{
  std::scoped_lock lock(_mutex);
  return _finalized.size();
}

}  // namespace pricebase

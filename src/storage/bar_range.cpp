/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/storage/bar_range.h"

namespace pricebase
{

BarRange::BarRange(const IStorageBackend& backend, PartitionKey key, TimePoint from, TimePoint to,
                   size_t pageSize)
    : _backend(&backend), _key(key), _from(from), _to(to), _pageSize(pageSize)
{
}

std::vector<OhlcvBar> BarRange::toVector() const
{
  std::vector<OhlcvBar> bars;
  for (const auto& bar : *this)
  {
    bars.push_back(bar);
  }
  return bars;
}

BarRange::Iterator::Iterator(const BarRange* range) : _range(range)
{
  fetch(_range->_from);
}

void BarRange::Iterator::fetch(TimePoint from)
{
  _pos = 0;
  if (from > _range->_to)
  {
    _page.clear();
    _lastPage = true;
    return;
  }
  _page = _range->_backend->scanBars(_range->_key, from, _range->_to, _range->_pageSize);
  _lastPage = _page.size() < _range->_pageSize;
}

BarRange::Iterator& BarRange::Iterator::operator++()
{
  ++_pos;
  if (_pos >= _page.size() && !_lastPage)
  {
    const auto resumeAt = _page.back().periodStart + std::chrono::nanoseconds(1);
    fetch(resumeAt);
  }
  return *this;
}

bool BarRange::Iterator::operator==(const Iterator& other) const
{
  if (atEnd() || other.atEnd())
  {
    return atEnd() == other.atEnd();
  }
  return _range == other._range && (*this)->periodStart == other->periodStart;
}

}  // namespace pricebase

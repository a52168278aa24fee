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

#include <cstddef>
#include <iterator>
#include <vector>

namespace pricebase
{

/// Lazy, time-ordered view over one bar partition between two inclusive
/// bounds. Nothing is read until iteration starts; every begin() scans the
/// backend again, page by page. The backend must outlive the range.
class BarRange
{
 public:
  class Iterator
  {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = OhlcvBar;
    using difference_type = std::ptrdiff_t;
    using pointer = const OhlcvBar*;
    using reference = const OhlcvBar&;

    Iterator() = default;

    reference operator*() const { return _page[_pos]; }
    pointer operator->() const { return &_page[_pos]; }

    Iterator& operator++();
    void operator++(int) { ++*this; }

    bool operator==(const Iterator& other) const;

   private:
    friend class BarRange;

    explicit Iterator(const BarRange* range);

    bool atEnd() const { return _pos >= _page.size(); }
    void fetch(TimePoint from);

    const BarRange* _range{nullptr};
    std::vector<OhlcvBar> _page;
    size_t _pos{0};
    bool _lastPage{true};
  };

  BarRange(const IStorageBackend& backend, PartitionKey key, TimePoint from, TimePoint to,
           size_t pageSize);

  Iterator begin() const { return Iterator(this); }
  Iterator end() const { return Iterator(); }

  std::vector<OhlcvBar> toVector() const;

  const PartitionKey& key() const { return _key; }
  TimePoint from() const { return _from; }
  TimePoint to() const { return _to; }

 private:
  const IStorageBackend* _backend;
  PartitionKey _key;
  TimePoint _from;
  TimePoint _to;
  size_t _pageSize;
};

}  // namespace pricebase

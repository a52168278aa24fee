/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace pricebase
{

/// Multi-producer, multi-consumer FIFO with a fixed capacity. Producers block
/// while it is full; after close() pushes fail and pops drain what is left.
template <typename T>
class BoundedQueue
{
 public:
  explicit BoundedQueue(size_t capacity) : _capacity(capacity == 0 ? 1 : capacity) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  bool push(T value)
  {
    std::unique_lock lock(_mutex);
    _notFull.wait(lock, [this] { return _closed || _items.size() < _capacity; });
    if (_closed)
    {
      return false;
    }
    _items.push_back(std::move(value));
    lock.unlock();
    _notEmpty.notify_one();
    return true;
  }

  bool tryPush(T value)
  {
    {
      std::scoped_lock lock(_mutex);
      if (_closed || _items.size() >= _capacity)
      {
        return false;
      }
      _items.push_back(std::move(value));
    }
    _notEmpty.notify_one();
    return true;
  }

  /// Blocks until an item is available; nullopt once closed and drained.
  std::optional<T> pop()
  {
    std::unique_lock lock(_mutex);
    _notEmpty.wait(lock, [this] { return _closed || !_items.empty(); });
    if (_items.empty())
    {
      return std::nullopt;
    }
    T value = std::move(_items.front());
    _items.pop_front();
    lock.unlock();
    _notFull.notify_one();
    return value;
  }

  std::optional<T> tryPop()
  {
    std::optional<T> value;
    {
      std::scoped_lock lock(_mutex);
      if (_items.empty())
      {
        return std::nullopt;
      }
      value.emplace(std::move(_items.front()));
      _items.pop_front();
    }
    _notFull.notify_one();
    return value;
  }

  void close()
  {
    {
      std::scoped_lock lock(_mutex);
      _closed = true;
    }
    _notEmpty.notify_all();
    _notFull.notify_all();
  }

  bool closed() const
  {
    std::scoped_lock lock(_mutex);
    return _closed;
  }

  size_t size() const
  {
    std::scoped_lock lock(_mutex);
    return _items.size();
  }

  size_t capacity() const noexcept { return _capacity; }

 private:
  const size_t _capacity;
  mutable std::mutex _mutex;
  std::condition_variable _notEmpty;
  std::condition_variable _notFull;
  std::deque<T> _items;
  bool _closed{false};
};

}  // namespace pricebase

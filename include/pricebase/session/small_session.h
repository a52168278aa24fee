/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/common.h"

#include <cstdint>
#include <optional>

namespace pricebase
{

enum class SessionState : uint8_t
{
  Open,
  Closed
};

/// One indivisible position: a single entry and a single exit. Values never
/// change; closing yields a new, closed copy.
class SmallSession
{
 public:
  /// Throws InvalidArgumentError unless price and amount are positive.
  static SmallSession open(SessionId id, MarketId market, Price startedPrice, Quantity amount,
                           TimePoint openedAt);

  /// Throws InvalidStateTransitionError when already closed.
  SmallSession closed(Price closedPrice, TimePoint closedAt) const;

  SessionId id() const noexcept { return _id; }
  MarketId market() const noexcept { return _market; }
  Price startedPrice() const noexcept { return _startedPrice; }
  Quantity amount() const noexcept { return _amount; }
  TimePoint openedAt() const noexcept { return _openedAt; }

  SessionState state() const noexcept { return _state; }
  bool isOpen() const noexcept { return _state == SessionState::Open; }
  bool isClosed() const noexcept { return _state == SessionState::Closed; }

  std::optional<Price> closedPrice() const noexcept { return _closedPrice; }
  std::optional<TimePoint> closedAt() const noexcept { return _closedAt; }

  /// startedPrice * amount, the sum debited on open.
  Amount cost() const { return _startedPrice * _amount; }

  /// (closedPrice - startedPrice) * amount; nullopt while open.
  std::optional<Amount> realizedPnl() const;

  /// (mark - startedPrice) * amount; zero once closed.
  Amount unrealizedPnl(Price mark) const;

  bool operator==(const SmallSession&) const = default;

 private:
  SmallSession() = default;

  SessionId _id{InvalidSessionId};
  MarketId _market{InvalidMarketId};
  Price _startedPrice{};
  Quantity _amount{};
  TimePoint _openedAt{};
  SessionState _state{SessionState::Open};
  std::optional<Price> _closedPrice;
  std::optional<TimePoint> _closedAt;
};

}  // namespace pricebase

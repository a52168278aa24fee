/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/session/small_session.h"

#include <map>
#include <vector>

namespace pricebase
{

/// Basket of independent SmallSessions on one market. Scaling in or out is
/// expressed as more sessions, never as resizing one.
class BigSession
{
 public:
  explicit BigSession(MarketId market) : _market(market) {}

  MarketId market() const noexcept { return _market; }

  /// Throws InvalidArgumentError for another market and
  /// InvalidStateTransitionError when the session is already in the basket.
  void addSession(const SmallSession& session);

  /// Replaces the open entry with its closed successor. Throws NotFoundError
  /// for unknown ids and InvalidStateTransitionError unless the stored entry
  /// is open and `closed` is closed.
  void recordClose(const SmallSession& closed);

  bool contains(SessionId id) const { return _sessions.contains(id); }
  size_t size() const noexcept { return _sessions.size(); }

  std::vector<SmallSession> openSessions() const;
  std::vector<SmallSession> closedSessions() const;

  Amount realizedPnl() const;
  Amount unrealizedPnl(Price mark) const;

  /// Realized P/L of closed sessions plus unrealized P/L of open ones at mark.
  Amount aggregatePnL(Price mark) const { return realizedPnl() + unrealizedPnl(mark); }

 private:
  MarketId _market;
  std::map<SessionId, SmallSession> _sessions;
};

}  // namespace pricebase

/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/session/small_session.h"
#include "pricebase/error.h"

#include <string>

namespace pricebase
{

SmallSession SmallSession::open(SessionId id, MarketId market, Price startedPrice,
                                Quantity amount, TimePoint openedAt)
{
  if (!amount.isPositive())
  {
    throw InvalidArgumentError("session amount must be positive, got " + amount.toString());
  }
  if (!startedPrice.isPositive())
  {
    throw InvalidArgumentError("session price must be positive, got " + startedPrice.toString());
  }
  // Throws when price * amount does not fit an Amount
  (void)(startedPrice * amount);

  SmallSession session;
  session._id = id;
  session._market = market;
  session._startedPrice = startedPrice;
  session._amount = amount;
  session._openedAt = openedAt;
  return session;
}

SmallSession SmallSession::closed(Price closedPrice, TimePoint closedAt) const
{
  if (isClosed())
  {
    throw InvalidStateTransitionError("session " + std::to_string(_id) + " is already closed");
  }
  if (!closedPrice.isPositive())
  {
    throw InvalidArgumentError("close price must be positive, got " + closedPrice.toString());
  }
  (void)(closedPrice * _amount);

  SmallSession next = *this;
  next._state = SessionState::Closed;
  next._closedPrice = closedPrice;
  next._closedAt = closedAt;
  return next;
}

std::optional<Amount> SmallSession::realizedPnl() const
{
  if (!_closedPrice)
  {
    return std::nullopt;
  }
  return (*_closedPrice - _startedPrice) * _amount;
}

Amount SmallSession::unrealizedPnl(Price mark) const
{
  if (isClosed())
  {
    return Amount{};
  }
  return (mark - _startedPrice) * _amount;
}

}  // namespace pricebase

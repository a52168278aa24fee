/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/session/big_session.h"
#include "pricebase/error.h"

#include <string>

namespace pricebase
{

void BigSession::addSession(const SmallSession& session)
{
  if (session.market() != _market)
  {
    throw InvalidArgumentError("session " + std::to_string(session.id()) + " trades market " +
                               std::to_string(session.market()) + ", basket holds market " +
                               std::to_string(_market));
  }
  if (_sessions.contains(session.id()))
  {
    throw InvalidStateTransitionError("session " + std::to_string(session.id()) +
                                      " is already part of this basket");
  }
  _sessions.emplace(session.id(), session);
}

void BigSession::recordClose(const SmallSession& closed)
{
  auto it = _sessions.find(closed.id());
  if (it == _sessions.end())
  {
    throw NotFoundError("session " + std::to_string(closed.id()) + " is not part of this basket");
  }
  if (it->second.isClosed() || !closed.isClosed())
  {
    throw InvalidStateTransitionError("session " + std::to_string(closed.id()) +
                                      " cannot be closed twice");
  }
  it->second = closed;
}

std::vector<SmallSession> BigSession::openSessions() const
{
  std::vector<SmallSession> result;
  for (const auto& [_, session] : _sessions)
  {
    if (session.isOpen())
    {
      result.push_back(session);
    }
  }
  return result;
}

std::vector<SmallSession> BigSession::closedSessions() const
{
  std::vector<SmallSession> result;
  for (const auto& [_, session] : _sessions)
  {
    if (session.isClosed())
    {
      result.push_back(session);
    }
  }
  return result;
}

Amount BigSession::realizedPnl() const
{
  Amount total{};
  for (const auto& [_, session] : _sessions)
  {
    if (auto pnl = session.realizedPnl())
    {
      total += *pnl;
    }
  }
  return total;
}

Amount BigSession::unrealizedPnl(Price mark) const
{
  Amount total{};
  for (const auto& [_, session] : _sessions)
  {
    total += session.unrealizedPnl(mark);
  }
  return total;
}

}  // namespace pricebase

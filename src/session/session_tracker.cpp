/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/session/session_tracker.h"
#include "pricebase/error.h"

namespace pricebase
{

SessionTracker::SessionTracker(const MarketRegistry& registry, const IClock& clock,
                               SessionTrackerOptions options)
    : _registry(registry), _clock(clock), _options(options)
{
}

SessionTracker::AccountSlot& SessionTracker::slotFor(std::string_view exchange)
{
  auto name = normalizeExchange(exchange);

  std::scoped_lock lock(_accountsMutex);
  auto& slot = _accounts[name];
  if (!slot)
  {
    slot = std::make_unique<AccountSlot>(name);
  }
  return *slot;
}

const SessionTracker::AccountSlot* SessionTracker::findSlot(const std::string& exchange) const
{
  std::scoped_lock lock(_accountsMutex);
  auto it = _accounts.find(exchange);
  return it != _accounts.end() ? it->second.get() : nullptr;
}

// =============================================================================
// Accounts
// =============================================================================

void SessionTracker::deposit(std::string_view exchange, std::string_view currency, Amount amount)
{
  auto& slot = slotFor(exchange);
  std::scoped_lock lock(slot.txMutex);
  slot.account.deposit(currency, amount);
}

void SessionTracker::withdraw(std::string_view exchange, std::string_view currency, Amount amount)
{
  auto& slot = slotFor(exchange);
  std::scoped_lock lock(slot.txMutex);
  slot.account.withdraw(currency, amount);
}

Amount SessionTracker::balance(std::string_view exchange, std::string_view currency) const
{
  const auto* slot = findSlot(normalizeExchange(exchange));
  if (!slot)
  {
    return Amount{};
  }
  std::scoped_lock lock(slot->txMutex);
  return slot->account.balance(currency);
}

Account SessionTracker::account(std::string_view exchange) const
{
  auto name = normalizeExchange(exchange);
  const auto* slot = findSlot(name);
  if (!slot)
  {
    return Account(name);
  }
  std::scoped_lock lock(slot->txMutex);
  return slot->account;
}

// =============================================================================
// Sessions
// =============================================================================

SmallSession SessionTracker::openIn(MarketId marketId, std::optional<BigSessionId> basket,
                                    Price price, Quantity amount)
{
  const Market market = _registry.lookup(marketId);
  if (!market.active && !_options.allowRetiredMarkets)
  {
    throw InvalidArgumentError("market " + market.displayName() + " is retired");
  }

  // Validates price and amount before any money moves
  auto session = SmallSession::open(_nextSessionId.fetch_add(1), marketId, price, amount,
                                    _clock.now());

  auto& slot = slotFor(market.exchange);
  std::scoped_lock txLock(slot.txMutex);
  std::scoped_lock stateLock(_stateMutex);

  BigSession* big = nullptr;
  if (basket)
  {
    auto it = _bigSessions.find(*basket);
    if (it == _bigSessions.end())
    {
      throw NotFoundError("big session " + std::to_string(*basket) + " does not exist");
    }
    big = &it->second;
  }

  slot.account.withdraw(market.base, session.cost());
  if (big)
  {
    big->addSession(session);
  }
  _sessions.emplace(session.id(), SessionEntry{session, basket});
  return session;
}

SmallSession SessionTracker::open(MarketId market, Price price, Quantity amount)
{
  return openIn(market, std::nullopt, price, amount);
}

SmallSession SessionTracker::openInBigSession(BigSessionId basket, Price price, Quantity amount)
{
  MarketId market = InvalidMarketId;
  {
    std::scoped_lock lock(_stateMutex);
    auto it = _bigSessions.find(basket);
    if (it == _bigSessions.end())
    {
      throw NotFoundError("big session " + std::to_string(basket) + " does not exist");
    }
    market = it->second.market();
  }
  return openIn(market, basket, price, amount);
}

SmallSession SessionTracker::close(SessionId id, Price price)
{
  MarketId marketId = InvalidMarketId;
  {
    std::scoped_lock lock(_stateMutex);
    auto it = _sessions.find(id);
    if (it == _sessions.end())
    {
      throw NotFoundError("session " + std::to_string(id) + " does not exist");
    }
    marketId = it->second.session.market();
  }

  const Market market = _registry.lookup(marketId);
  auto& slot = slotFor(market.exchange);
  std::scoped_lock txLock(slot.txMutex);
  std::scoped_lock stateLock(_stateMutex);

  auto& entry = _sessions.at(id);
  // Throws for a second close before any money moves
  SmallSession closed = entry.session.closed(price, _clock.now());

  const Amount proceeds = price * closed.amount();
  slot.account.deposit(market.base, proceeds);

  if (entry.basket)
  {
    _bigSessions.at(*entry.basket).recordClose(closed);
  }
  entry.session = closed;
  return closed;
}

std::optional<SmallSession> SessionTracker::session(SessionId id) const
{
  std::scoped_lock lock(_stateMutex);
  auto it = _sessions.find(id);
  if (it == _sessions.end())
  {
    return std::nullopt;
  }
  return it->second.session;
}

std::vector<SmallSession> SessionTracker::sessions() const
{
  std::scoped_lock lock(_stateMutex);
  std::vector<SmallSession> result;
  result.reserve(_sessions.size());
  for (const auto& [_, entry] : _sessions)
  {
    result.push_back(entry.session);
  }
  return result;
}

std::vector<SmallSession> SessionTracker::openSessions() const
{
  std::scoped_lock lock(_stateMutex);
  std::vector<SmallSession> result;
  for (const auto& [_, entry] : _sessions)
  {
    if (entry.session.isOpen())
    {
      result.push_back(entry.session);
    }
  }
  return result;
}

// =============================================================================
// Baskets
// =============================================================================

BigSessionId SessionTracker::createBigSession(MarketId market)
{
  _registry.lookup(market);  // throws NotFoundError

  const BigSessionId id = _nextBigSessionId.fetch_add(1);
  std::scoped_lock lock(_stateMutex);
  _bigSessions.emplace(id, BigSession(market));
  return id;
}

void SessionTracker::addToBigSession(BigSessionId basket, SessionId session)
{
  std::scoped_lock lock(_stateMutex);
  auto basketIt = _bigSessions.find(basket);
  if (basketIt == _bigSessions.end())
  {
    throw NotFoundError("big session " + std::to_string(basket) + " does not exist");
  }
  auto sessionIt = _sessions.find(session);
  if (sessionIt == _sessions.end())
  {
    throw NotFoundError("session " + std::to_string(session) + " does not exist");
  }
  if (sessionIt->second.basket)
  {
    throw InvalidStateTransitionError("session " + std::to_string(session) +
                                      " already belongs to big session " +
                                      std::to_string(*sessionIt->second.basket));
  }

  basketIt->second.addSession(sessionIt->second.session);
  sessionIt->second.basket = basket;
}

BigSession SessionTracker::bigSession(BigSessionId basket) const
{
  std::scoped_lock lock(_stateMutex);
  auto it = _bigSessions.find(basket);
  if (it == _bigSessions.end())
  {
    throw NotFoundError("big session " + std::to_string(basket) + " does not exist");
  }
  return it->second;
}

}  // namespace pricebase

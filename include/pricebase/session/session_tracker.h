/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "pricebase/clock/abstract_clock.h"
#include "pricebase/market/market_registry.h"
#include "pricebase/session/account.h"
#include "pricebase/session/big_session.h"
#include "pricebase/session/small_session.h"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pricebase
{

using BigSessionId = uint64_t;

struct SessionTrackerOptions
{
  /// Replays of stored history may trade markets that have since been retired.
  bool allowRetiredMarkets{false};
};

/**
 * Owns sessions and accounts and moves money between them.
 *
 * open() debits price * amount of the market's base currency from the
 * account of the market's exchange; close() credits closePrice * amount back.
 * Each open/close is one transaction serialized on that account, so balance
 * checks and updates never interleave. Markets are only referenced by id.
 */
class SessionTracker
{
 public:
  SessionTracker(const MarketRegistry& registry, const IClock& clock,
                 SessionTrackerOptions options = {});

  void deposit(std::string_view exchange, std::string_view currency, Amount amount);
  void withdraw(std::string_view exchange, std::string_view currency, Amount amount);
  Amount balance(std::string_view exchange, std::string_view currency) const;

  /// Snapshot; an untouched exchange yields an empty account.
  Account account(std::string_view exchange) const;

  /// Throws NotFoundError for unknown markets, InvalidArgumentError for
  /// retired markets (unless allowed), non-positive inputs or a cost outside
  /// the decimal range, and InsufficientBalanceError when the account cannot
  /// cover price * amount.
  SmallSession open(MarketId market, Price price, Quantity amount);

  /// Same as open(), also adding the session to a basket.
  SmallSession openInBigSession(BigSessionId basket, Price price, Quantity amount);

  /// Throws NotFoundError for unknown ids and InvalidStateTransitionError for
  /// closed sessions.
  SmallSession close(SessionId id, Price price);

  std::optional<SmallSession> session(SessionId id) const;
  std::vector<SmallSession> sessions() const;
  std::vector<SmallSession> openSessions() const;

  BigSessionId createBigSession(MarketId market);
  void addToBigSession(BigSessionId basket, SessionId session);
  BigSession bigSession(BigSessionId basket) const;

 private:
  struct AccountSlot
  {
    explicit AccountSlot(std::string_view exchange) : account(exchange) {}

    mutable std::mutex txMutex;
    Account account;
  };

  struct SessionEntry
  {
    SmallSession session;
    std::optional<BigSessionId> basket;
  };

  AccountSlot& slotFor(std::string_view exchange);
  const AccountSlot* findSlot(const std::string& exchange) const;

  SmallSession openIn(MarketId market, std::optional<BigSessionId> basket, Price price,
                      Quantity amount);

  const MarketRegistry& _registry;
  const IClock& _clock;
  SessionTrackerOptions _options;

  mutable std::mutex _accountsMutex;
  std::unordered_map<std::string, std::unique_ptr<AccountSlot>> _accounts;

  // Lock order: AccountSlot::txMutex, then _stateMutex
  mutable std::mutex _stateMutex;
  std::map<SessionId, SessionEntry> _sessions;
  std::map<BigSessionId, BigSession> _bigSessions;

  std::atomic<SessionId> _nextSessionId{1};
  std::atomic<BigSessionId> _nextBigSessionId{1};
};

}  // namespace pricebase

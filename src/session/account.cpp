/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/session/account.h"
#include "pricebase/error.h"
#include "pricebase/market/market.h"

namespace pricebase
{

Account::Account(std::string_view exchange) : _exchange(normalizeExchange(exchange)) {}

Amount Account::balance(std::string_view currency) const
{
  auto it = _balances.find(normalizeCurrency(currency));
  return it != _balances.end() ? it->second : Amount{};
}

void Account::deposit(std::string_view currency, Amount amount)
{
  if (amount.isNegative())
  {
    throw InvalidArgumentError("cannot deposit a negative amount " + amount.toString());
  }
  auto& balance = _balances[normalizeCurrency(currency)];
  int64_t next = 0;
  if (__builtin_add_overflow(balance.raw(), amount.raw(), &next))
  {
    throw InvalidArgumentError("deposit of " + amount.toString() + " overflows the " +
                               normalizeCurrency(currency) + " balance");
  }
  balance = Amount::fromRaw(next);
}

void Account::withdraw(std::string_view currency, Amount amount)
{
  if (amount.isNegative())
  {
    throw InvalidArgumentError("cannot withdraw a negative amount " + amount.toString());
  }

  auto key = normalizeCurrency(currency);
  const Amount available = balance(key);
  if (amount > available)
  {
    throw InsufficientBalanceError(key, amount.toString(), available.toString());
  }
  _balances[key] = available - amount;
}

}  // namespace pricebase

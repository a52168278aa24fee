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

#include <map>
#include <string>
#include <string_view>

namespace pricebase
{

/// Currency balances held on one exchange. Not synchronized; SessionTracker
/// serializes access per account.
class Account
{
 public:
  explicit Account(std::string_view exchange);

  const std::string& exchange() const { return _exchange; }

  /// Zero for currencies never touched.
  Amount balance(std::string_view currency) const;

  /// Throws InvalidArgumentError for negative amounts.
  void deposit(std::string_view currency, Amount amount);

  /// Throws InsufficientBalanceError, leaving the balance unchanged, when the
  /// withdrawal would make it negative.
  void withdraw(std::string_view currency, Amount amount);

  const std::map<std::string, Amount>& balances() const { return _balances; }

  bool operator==(const Account&) const = default;

 private:
  std::string _exchange;
  std::map<std::string, Amount> _balances;
};

}  // namespace pricebase

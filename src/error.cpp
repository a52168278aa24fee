/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#include "pricebase/error.h"

namespace pricebase
{

std::string_view toString(ErrorCode code) noexcept
{
  switch (code)
  {
    case ErrorCode::InvalidSymbol:
      return "InvalidSymbol";
    case ErrorCode::InvalidBar:
      return "InvalidBar";
    case ErrorCode::Conflict:
      return "ConflictError";
    case ErrorCode::StorageUnavailable:
      return "StorageUnavailable";
    case ErrorCode::InsufficientBalance:
      return "InsufficientBalance";
    case ErrorCode::InvalidStateTransition:
      return "InvalidStateTransition";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
  }
  return "Unknown";
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(toString(code)) + ": " + message), _code(code)
{
}

InsufficientBalanceError::InsufficientBalanceError(const std::string& currency,
                                                   const std::string& tried,
                                                   const std::string& available)
    : Error(ErrorCode::InsufficientBalance,
            "tried to remove " + tried + " " + currency + " while having " + available + " " + currency),
      _currency(currency)
{
}

}  // namespace pricebase

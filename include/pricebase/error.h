/*
 * PriceBase
 * Developed by FLOX Foundation (https://github.com/FLOX-Foundation)
 *
 * Copyright (c) 2025 FLOX Foundation
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pricebase
{

enum class ErrorCode : uint8_t
{
  InvalidSymbol,
  InvalidBar,
  Conflict,
  StorageUnavailable,
  InsufficientBalance,
  InvalidStateTransition,
  NotFound,
  InvalidArgument
};

std::string_view toString(ErrorCode code) noexcept;

/// Only transient storage failures may be retried by the caller.
constexpr bool isRetryable(ErrorCode code) noexcept
{
  return code == ErrorCode::StorageUnavailable;
}

class Error : public std::runtime_error
{
 public:
  Error(ErrorCode code, const std::string& message);

  ErrorCode code() const noexcept { return _code; }
  bool retryable() const noexcept { return isRetryable(_code); }

 private:
  ErrorCode _code;
};

class InvalidSymbolError : public Error
{
 public:
  explicit InvalidSymbolError(const std::string& message) : Error(ErrorCode::InvalidSymbol, message) {}
};

class InvalidBarError : public Error
{
 public:
  explicit InvalidBarError(const std::string& message) : Error(ErrorCode::InvalidBar, message) {}
};

class ConflictError : public Error
{
 public:
  explicit ConflictError(const std::string& message) : Error(ErrorCode::Conflict, message) {}
};

class StorageUnavailableError : public Error
{
 public:
  explicit StorageUnavailableError(const std::string& message)
      : Error(ErrorCode::StorageUnavailable, message)
  {
  }
};

class InsufficientBalanceError : public Error
{
 public:
  InsufficientBalanceError(const std::string& currency, const std::string& tried,
                           const std::string& available);

  const std::string& currency() const noexcept { return _currency; }

 private:
  std::string _currency;
};

class InvalidStateTransitionError : public Error
{
 public:
  explicit InvalidStateTransitionError(const std::string& message)
      : Error(ErrorCode::InvalidStateTransition, message)
  {
  }
};

class NotFoundError : public Error
{
 public:
  explicit NotFoundError(const std::string& message) : Error(ErrorCode::NotFound, message) {}
};

class InvalidArgumentError : public Error
{
 public:
  explicit InvalidArgumentError(const std::string& message)
      : Error(ErrorCode::InvalidArgument, message)
  {
  }
};

}  // namespace pricebase

/*
    MFlag - collectible municipal flags on XAYA
    Copyright (C) 2026  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#ifndef MFLAG_ERRORS_HPP
#define MFLAG_ERRORS_HPP

#include <json/json.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace mflag
{

/**
 * The kinds of failure a contract operation can end with.  Any of them
 * reverts everything the failing call has done.
 */
enum class ErrorKind
{

  /* Malformed input.  */
  INVALID_CATEGORY,
  INVALID_PRICE,
  INVALID_NFTS_REQUIRED,
  ARRAY_LENGTH_MISMATCH,

  /* Registry.  */
  NOT_REGISTERED,
  ALREADY_REGISTERED,

  /* Claim / purchase state machine.  */
  FIRST_ALREADY_CLAIMED,
  FIRST_NOT_CLAIMED,
  SECOND_ALREADY_PURCHASED,

  /* Payment and native transfers.  */
  INSUFFICIENT_PAYMENT,
  REFUND_FAILED,
  WITHDRAWAL_FAILED,
  NO_BALANCE_TO_WITHDRAW,
  INSUFFICIENT_FUNDS,

  UNAUTHORIZED,
  REENTRANT_CALL,

  /* Token surface.  */
  NOT_FOUND,
  INVALID_OWNER,
  INCORRECT_OWNER,
  INSUFFICIENT_APPROVAL,
  INVALID_APPROVER,
  INVALID_OPERATOR,
  INVALID_RECEIVER,
  OUT_OF_BOUNDS_INDEX,

};

/**
 * Returns the name of an error kind as it is reported to callers,
 * e.g. "InsufficientPayment".
 */
std::string ErrorKindToString (ErrorKind kind);

/**
 * Exception thrown by contract operations.  It carries the error kind
 * and the parameters of the error (e.g. required and sent amount
 * for InsufficientPayment) formatted as strings.
 */
class ContractError : public std::runtime_error
{

private:

  /** The kind of error.  */
  ErrorKind kind;

  /** The parameters of the error.  */
  std::vector<std::string> params;

  /**
   * Builds the message returned from what(), which is of the
   * form "Kind(param1, param2)".
   */
  static std::string FormatMessage (ErrorKind k,
                                    const std::vector<std::string>& p);

public:

  explicit ContractError (const ErrorKind k,
                          const std::vector<std::string>& p = {})
    : std::runtime_error(FormatMessage (k, p)),
      kind(k), params(p)
  {}

  ErrorKind
  GetKind () const
  {
    return kind;
  }

  const std::vector<std::string>&
  GetParams () const
  {
    return params;
  }

  /**
   * Returns a JSON form of the error, with "error" set to the kind's name
   * and "params" holding the parameters.
   */
  Json::Value ToJson () const;

};

} // namespace mflag

#endif // MFLAG_ERRORS_HPP

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

#include "errors.hpp"

#include <glog/logging.h>

#include <sstream>

namespace mflag
{

std::string
ErrorKindToString (const ErrorKind kind)
{
  switch (kind)
    {
    case ErrorKind::INVALID_CATEGORY:
      return "InvalidCategory";
    case ErrorKind::INVALID_PRICE:
      return "InvalidPrice";
    case ErrorKind::INVALID_NFTS_REQUIRED:
      return "InvalidNftsRequired";
    case ErrorKind::ARRAY_LENGTH_MISMATCH:
      return "ArrayLengthMismatch";

    case ErrorKind::NOT_REGISTERED:
      return "NotRegistered";
    case ErrorKind::ALREADY_REGISTERED:
      return "AlreadyRegistered";

    case ErrorKind::FIRST_ALREADY_CLAIMED:
      return "FirstAlreadyClaimed";
    case ErrorKind::FIRST_NOT_CLAIMED:
      return "FirstNotClaimed";
    case ErrorKind::SECOND_ALREADY_PURCHASED:
      return "SecondAlreadyPurchased";

    case ErrorKind::INSUFFICIENT_PAYMENT:
      return "InsufficientPayment";
    case ErrorKind::REFUND_FAILED:
      return "RefundFailed";
    case ErrorKind::WITHDRAWAL_FAILED:
      return "WithdrawalFailed";
    case ErrorKind::NO_BALANCE_TO_WITHDRAW:
      return "NoBalanceToWithdraw";
    case ErrorKind::INSUFFICIENT_FUNDS:
      return "InsufficientFunds";

    case ErrorKind::UNAUTHORIZED:
      return "Unauthorized";
    case ErrorKind::REENTRANT_CALL:
      return "ReentrantCall";

    case ErrorKind::NOT_FOUND:
      return "NotFound";
    case ErrorKind::INVALID_OWNER:
      return "InvalidOwner";
    case ErrorKind::INCORRECT_OWNER:
      return "IncorrectOwner";
    case ErrorKind::INSUFFICIENT_APPROVAL:
      return "InsufficientApproval";
    case ErrorKind::INVALID_APPROVER:
      return "InvalidApprover";
    case ErrorKind::INVALID_OPERATOR:
      return "InvalidOperator";
    case ErrorKind::INVALID_RECEIVER:
      return "InvalidReceiver";
    case ErrorKind::OUT_OF_BOUNDS_INDEX:
      return "OutOfBoundsIndex";

    default:
      LOG (FATAL) << "Invalid error kind: " << static_cast<int> (kind);
    }
}

std::string
ContractError::FormatMessage (const ErrorKind k,
                              const std::vector<std::string>& p)
{
  std::ostringstream out;
  out << ErrorKindToString (k) << '(';

  bool first = true;
  for (const auto& param : p)
    {
      if (!first)
        out << ", ";
      first = false;
      out << param;
    }

  out << ')';
  return out.str ();
}

Json::Value
ContractError::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["error"] = ErrorKindToString (kind);

  Json::Value arr(Json::arrayValue);
  for (const auto& p : params)
    arr.append (p);
  res["params"] = arr;

  return res;
}

} // namespace mflag

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

#include "moveprocessor.hpp"

#include "errors.hpp"

#include <xayautil/jsonutils.hpp>

#include <glog/logging.h>

namespace mfg
{

using mflag::Address;
using mflag::Amount;
using mflag::FlagId;
using mflag::TokenId;

namespace
{

/**
 * Parses a small unsigned integer (category or number of tokens).
 */
bool
ParseUnsigned (const Json::Value& val, unsigned& res)
{
  if (!val.isUInt ())
    return false;

  res = val.asUInt ();
  return true;
}

/**
 * Parses a Xaya name (without "p/") into the corresponding address.
 */
bool
ParseName (const Json::Value& val, Address& res)
{
  if (!val.isString () || val.asString ().empty ())
    return false;

  res = PlayerAddress (val.asString ());
  return true;
}

/**
 * Parses a JSON array with elements of the given type.
 */
template <typename T, typename Fcn>
  bool
  ParseArray (const Json::Value& val, const Fcn& parse, std::vector<T>& res)
{
  if (!val.isArray ())
    return false;

  res.clear ();
  for (const auto& entry : val)
    {
      T cur;
      if (!parse (entry, cur))
        return false;
      res.push_back (cur);
    }

  return true;
}

} // anonymous namespace

bool
MoveParser::ExtractSender (const Json::Value& obj, Address& sender)
{
  if (!obj.isObject ())
    return false;

  return ParseName (obj["name"], sender);
}

void
MoveParser::ParseMove (const Json::Value& obj)
{
  Address sender;
  if (!ExtractSender (obj, sender))
    {
      LOG (WARNING) << "Move without valid sender: " << obj;
      return;
    }

  const auto& mv = obj["move"];
  if (mv.isArray ())
    {
      for (const auto& op : mv)
        HandleOperation (sender, op);
    }
  else
    HandleOperation (sender, mv);
}

void
MoveParser::HandleOperation (const Address& sender, const Json::Value& op)
{
  if (!op.isObject () || op.size () != 1)
    {
      LOG (WARNING) << "Invalid operation from " << sender << ": " << op;
      return;
    }

  const std::string key = op.getMemberNames ().front ();
  const auto& val = op[key];
  VLOG (1) << "Operation " << key << " from " << sender << ": " << val;

  FlagId id;
  Address name;

  if (key == "r")
    HandleRegister (sender, val);
  else if (key == "rb")
    HandleBatchRegister (sender, val);
  else if (key == "c" && mflag::AmountFromJson (val, id))
    ProcessClaim (sender, id);
  else if (key == "b" && mflag::AmountFromJson (val, id))
    ProcessPurchase (sender, id);
  else if (key == "h")
    HandleMetadataHash (sender, val);
  else if (key == "u" && val.isString ())
    ProcessBaseUri (sender, val.asString ());
  else if (key == "w" && val.isObject () && val.empty ())
    ProcessWithdraw (sender);
  else if (key == "t")
    HandleTransfer (sender, val);
  else if (key == "o" && ParseName (val, name))
    ProcessOwnership (sender, name);
  else
    LOG (WARNING) << "Invalid operation from " << sender << ": " << op;
}

void
MoveParser::HandleRegister (const Address& sender, const Json::Value& op)
{
  FlagId id;
  unsigned category;
  Amount price;
  if (!op.isObject ()
        || !mflag::AmountFromJson (op["id"], id)
        || !ParseUnsigned (op["c"], category)
        || !mflag::AmountFromJson (op["p"], price))
    {
      LOG (WARNING) << "Invalid registration from " << sender << ": " << op;
      return;
    }

  if (!op.isMember ("n"))
    {
      ProcessRegister (sender, id, category, price, nullptr);
      return;
    }

  unsigned nfts;
  if (!ParseUnsigned (op["n"], nfts))
    {
      LOG (WARNING) << "Invalid registration from " << sender << ": " << op;
      return;
    }

  ProcessRegister (sender, id, category, price, &nfts);
}

void
MoveParser::HandleBatchRegister (const Address& sender, const Json::Value& op)
{
  std::vector<FlagId> ids;
  std::vector<unsigned> categories;
  std::vector<Amount> prices;
  if (!op.isObject ()
        || !ParseArray (op["id"], mflag::AmountFromJson, ids)
        || !ParseArray (op["c"], ParseUnsigned, categories)
        || !ParseArray (op["p"], mflag::AmountFromJson, prices))
    {
      LOG (WARNING)
          << "Invalid batch registration from " << sender << ": " << op;
      return;
    }

  if (!op.isMember ("n"))
    {
      ProcessBatchRegister (sender, ids, categories, prices, nullptr);
      return;
    }

  std::vector<unsigned> nfts;
  if (!ParseArray (op["n"], ParseUnsigned, nfts))
    {
      LOG (WARNING)
          << "Invalid batch registration from " << sender << ": " << op;
      return;
    }

  ProcessBatchRegister (sender, ids, categories, prices, &nfts);
}

void
MoveParser::HandleMetadataHash (const Address& sender, const Json::Value& op)
{
  FlagId id;
  if (!op.isObject ()
        || !mflag::AmountFromJson (op["id"], id)
        || !op["h"].isString ())
    {
      LOG (WARNING) << "Invalid metadata move from " << sender << ": " << op;
      return;
    }

  ProcessMetadataHash (sender, id, op["h"].asString ());
}

void
MoveParser::HandleTransfer (const Address& sender, const Json::Value& op)
{
  Address to;
  if (!op.isObject ()
        || !op["id"].isUInt64 ()
        || !ParseName (op["to"], to))
    {
      LOG (WARNING) << "Invalid transfer from " << sender << ": " << op;
      return;
    }

  ProcessTransfer (sender, to, op["id"].asUInt64 ());
}

/* ************************************************************************** */

template <typename Fcn>
  void
  MoveProcessor::Execute (const Address& sender, const std::string& what,
                          const Fcn& f)
{
  try
    {
      f ();
      LOG (INFO) << "Executed " << what << " from " << sender;
    }
  catch (const mflag::ContractError& exc)
    {
      LOG (WARNING)
          << "Failed " << what << " from " << sender << ": " << exc.what ();
    }
}

void
MoveProcessor::ProcessRegister (const Address& sender, const FlagId& id,
                                const unsigned category, const Amount& price,
                                const unsigned* nftsRequired)
{
  Execute (sender, "registration of " + mflag::AmountToString (id),
           [&] ()
    {
      if (nftsRequired == nullptr)
        contract.RegisterFlagSimple (sender, id, category, price);
      else
        contract.RegisterFlag (sender, id, category, price, *nftsRequired);
    });
}

void
MoveProcessor::ProcessBatchRegister (
    const Address& sender,
    const std::vector<FlagId>& ids,
    const std::vector<unsigned>& categories,
    const std::vector<Amount>& prices,
    const std::vector<unsigned>* nftsRequired)
{
  Execute (sender,
           "batch registration of " + std::to_string (ids.size ()) + " flags",
           [&] ()
    {
      if (nftsRequired == nullptr)
        contract.BatchRegisterFlagsSimple (sender, ids, categories, prices);
      else
        contract.BatchRegisterFlags (sender, ids, categories, prices,
                                     *nftsRequired);
    });
}

void
MoveProcessor::ProcessClaim (const Address& sender, const FlagId& id)
{
  Execute (sender, "claim of " + mflag::AmountToString (id),
           [&] ()
    {
      contract.ClaimFirstNft (sender, id);
    });
}

void
MoveProcessor::ProcessPurchase (const Address& sender, const FlagId& id)
{
  /* The purchase is paid from the sender's full ledger balance, which
     includes the payment made with this move.  Anything above the price
     is refunded right back to it.  */
  const Amount value = chain.GetBalance (sender);
  Execute (sender, "purchase of " + mflag::AmountToString (id),
           [&] ()
    {
      contract.PurchaseSecondNft (sender, id, value);
    });
}

void
MoveProcessor::ProcessMetadataHash (const Address& sender, const FlagId& id,
                                    const std::string& hash)
{
  Execute (sender, "metadata update of " + mflag::AmountToString (id),
           [&] ()
    {
      contract.SetMetadataHash (sender, id, hash);
    });
}

void
MoveProcessor::ProcessBaseUri (const Address& sender, const std::string& uri)
{
  Execute (sender, "base URI update", [&] ()
    {
      contract.SetBaseUri (sender, uri);
    });
}

void
MoveProcessor::ProcessWithdraw (const Address& sender)
{
  Execute (sender, "withdrawal", [&] ()
    {
      contract.Withdraw (sender);
    });
}

void
MoveProcessor::ProcessTransfer (const Address& sender, const Address& to,
                                const TokenId id)
{
  Execute (sender, "transfer of token " + std::to_string (id), [&] ()
    {
      contract.TransferFrom (sender, sender, to, id);
    });
}

void
MoveProcessor::ProcessOwnership (const Address& sender,
                                 const Address& newOwner)
{
  Execute (sender, "ownership transfer to " + newOwner, [&] ()
    {
      contract.TransferOwnership (sender, newOwner);
    });
}

Amount
MoveProcessor::GetPayment (const Json::Value& obj, const std::string& addr)
{
  const auto& out = obj["out"];
  if (!out.isObject () || !out.isMember (addr))
    return 0;

  int64_t sat;
  CHECK (xaya::ChiAmountFromJson (out[addr], sat))
      << "Invalid payment in move notification: " << out;
  CHECK_GE (sat, 0);

  return static_cast<uint64_t> (sat);
}

void
MoveProcessor::ProcessOne (const Json::Value& obj)
{
  Address sender;
  if (ExtractSender (obj, sender))
    {
      const Amount paid = GetPayment (obj, params.PaymentAddress ());
      if (paid > 0)
        {
          LOG (INFO)
              << "Payment of " << mflag::AmountToString (paid)
              << " sat from " << sender;
          chain.Deposit (sender, paid);
        }
    }

  ParseMove (obj);
}

void
MoveProcessor::ProcessAll (const Json::Value& moves)
{
  CHECK (moves.isArray ()) << "Moves are not an array: " << moves;
  for (const auto& mv : moves)
    ProcessOne (mv);
}

} // namespace mfg

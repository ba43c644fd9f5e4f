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

#include "json.hpp"

#include "proto/events.pb.h"
#include "proto/state.pb.h"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>

namespace mflag
{

namespace
{

/**
 * Converts an integer to JSON, making sure to do it with the proper
 * JSON int64 type.
 */
Json::Value
IntToJson (const int64_t val)
{
  return static_cast<Json::Int64> (val);
}

} // anonymous namespace

std::string
CategoryToString (const Category c)
{
  switch (c)
    {
    case Category::STANDARD:
      return "standard";
    case Category::PLUS:
      return "plus";
    case Category::PREMIUM:
      return "premium";
    default:
      LOG (FATAL) << "Invalid category: " << static_cast<int> (c);
    }
}

bool
CategoryFromString (const std::string& str, Category& res)
{
  std::string lower = str;
  std::transform (lower.begin (), lower.end (), lower.begin (),
                  [] (const unsigned char c) { return std::tolower (c); });

  if (lower == "standard")
    res = Category::STANDARD;
  else if (lower == "plus")
    res = Category::PLUS;
  else if (lower == "premium")
    res = Category::PREMIUM;
  else
    return false;

  return true;
}

Json::Value
FlagPairToJson (const FlagPair& f)
{
  Json::Value res(Json::objectValue);
  res["id"] = AmountToJson (f.id);
  res["category"] = CategoryToString (f.category);
  res["price"] = AmountToJson (f.price);
  res["nfts_required"] = IntToJson (f.nftsRequired);

  res["first_minted"] = f.firstMinted;
  res["second_minted"] = f.secondMinted;
  res["pair_complete"] = f.pairComplete;

  if (f.firstMinted)
    res["first_owner"] = f.firstOwner;
  if (f.secondMinted)
    res["second_owner"] = f.secondOwner;

  res["first_minted_count"] = IntToJson (f.firstMintedCount);
  res["second_minted_count"] = IntToJson (f.secondMintedCount);
  res["first_token_id"] = IntToJson (f.firstTokenId);
  res["second_token_id"] = IntToJson (f.secondTokenId);

  if (!f.metadataHash.empty ())
    res["metadata_hash"] = f.metadataHash;

  return res;
}

Json::Value
TokenIdsToJson (const std::vector<TokenId>& ids)
{
  Json::Value res(Json::arrayValue);
  for (const auto id : ids)
    res.append (IntToJson (id));
  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::Event> (const proto::Event& pb)
{
  Json::Value res(Json::objectValue);

  switch (pb.kind_case ())
    {
    case proto::Event::kFlagRegistered:
      {
        const auto& e = pb.flag_registered ();
        res["type"] = "flag_registered";
        res["flag_id"] = e.flag_id ();
        res["category"] = IntToJson (e.category ());
        res["price"] = e.price ();
        res["nfts_required"] = IntToJson (e.nfts_required ());
        break;
      }

    case proto::Event::kFirstNftClaimed:
      {
        const auto& e = pb.first_nft_claimed ();
        res["type"] = "first_nft_claimed";
        res["flag_id"] = e.flag_id ();
        res["token_id"] = IntToJson (e.token_id ());
        res["claimer"] = e.claimer ();
        res["ordinal"] = IntToJson (e.ordinal ());
        break;
      }

    case proto::Event::kSecondNftPurchased:
      {
        const auto& e = pb.second_nft_purchased ();
        res["type"] = "second_nft_purchased";
        res["flag_id"] = e.flag_id ();
        res["token_id"] = IntToJson (e.token_id ());
        res["buyer"] = e.buyer ();
        res["price_paid"] = e.price_paid ();
        res["ordinal"] = IntToJson (e.ordinal ());
        break;
      }

    case proto::Event::kPairCompleted:
      res["type"] = "pair_completed";
      res["flag_id"] = pb.pair_completed ().flag_id ();
      res["completed_by"] = pb.pair_completed ().completed_by ();
      break;

    case proto::Event::kDiscountGranted:
      res["type"] = "discount_granted";
      res["user"] = pb.discount_granted ().user ();
      res["tier"] = IntToJson (pb.discount_granted ().tier ());
      break;

    case proto::Event::kBaseUriUpdated:
      res["type"] = "base_uri_updated";
      res["base_uri"] = pb.base_uri_updated ().base_uri ();
      break;

    case proto::Event::kMetadataHashSet:
      res["type"] = "metadata_hash_set";
      res["flag_id"] = pb.metadata_hash_set ().flag_id ();
      res["metadata_hash"] = pb.metadata_hash_set ().metadata_hash ();
      break;

    case proto::Event::kWithdrawal:
      res["type"] = "withdrawal";
      res["to"] = pb.withdrawal ().to ();
      res["amount"] = pb.withdrawal ().amount ();
      break;

    case proto::Event::kOwnershipTransferred:
      res["type"] = "ownership_transferred";
      res["previous_owner"] = pb.ownership_transferred ().previous_owner ();
      res["new_owner"] = pb.ownership_transferred ().new_owner ();
      break;

    case proto::Event::kTransfer:
      res["type"] = "transfer";
      res["from"] = pb.transfer ().from ();
      res["to"] = pb.transfer ().to ();
      res["token_id"] = IntToJson (pb.transfer ().token_id ());
      break;

    case proto::Event::kApproval:
      res["type"] = "approval";
      res["owner"] = pb.approval ().owner ();
      res["approved"] = pb.approval ().approved ();
      res["token_id"] = IntToJson (pb.approval ().token_id ());
      break;

    case proto::Event::kApprovalForAll:
      res["type"] = "approval_for_all";
      res["owner"] = pb.approval_for_all ().owner ();
      res["operator"] = pb.approval_for_all ().op ();
      res["approved"] = pb.approval_for_all ().approved ();
      break;

    default:
      LOG (FATAL) << "Unexpected event: " << pb.DebugString ();
    }

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::Globals> (const proto::Globals& pb)
{
  Json::Value res(Json::objectValue);
  res["owner"] = pb.owner ();
  res["base_uri"] = pb.base_uri ();
  res["tokens_minted"] = IntToJson (pb.token_counter ());

  return res;
}

} // namespace mflag

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

#include "rpcserver.hpp"

#include "params.hpp"

#include "errors.hpp"
#include "json.hpp"

#include <glog/logging.h>

namespace mfg
{

namespace
{

/**
 * Parses a flag ID given as RPC argument, throwing an invalid-params error
 * if it is malformed.
 */
mflag::FlagId
ParseFlagIdArg (const std::string& str)
{
  mflag::FlagId res;
  if (!mflag::AmountFromString (str, res))
    throw jsonrpc::JsonRpcException (jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS,
                                     "invalid flag ID: " + str);
  return res;
}

/**
 * Parses a name given as RPC argument.
 */
mflag::Address
ParseNameArg (const std::string& name)
{
  if (name.empty ())
    throw jsonrpc::JsonRpcException (jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS,
                                     "name must not be empty");
  return PlayerAddress (name);
}

} // anonymous namespace

void
RpcServer::stop ()
{
  LOG (INFO) << "RPC method called: stop";
  game.RequestStop ();
}

Json::Value
RpcServer::getcurrentstate ()
{
  LOG (INFO) << "RPC method called: getcurrentstate";
  return game.GetCurrentJsonState ();
}

Json::Value
RpcServer::getpendingstate ()
{
  LOG (INFO) << "RPC method called: getpendingstate";
  return game.GetPendingJsonState ();
}

Json::Value
RpcServer::getcontract ()
{
  LOG (INFO) << "RPC method called: getcontract";
  return logic.GetCustomStateData (game,
      [] (const mflag::FlagViews& views)
      {
        Json::Value res(Json::objectValue);
        res["name"] = mflag::FlagViews::NAME;
        res["symbol"] = mflag::FlagViews::SYMBOL;
        res["owner"] = views.GetOwner ();
        res["base_uri"] = views.GetBaseUri ();
        res["balance"] = mflag::AmountToJson (views.GetContractBalance ());
        res["total_flags"]
            = static_cast<Json::Int64> (views.GetTotalRegisteredFlags ());
        res["tokens_minted"]
            = static_cast<Json::Int64> (views.GetTotalTokensMinted ());
        res["total_supply"]
            = static_cast<Json::Int64> (views.TotalSupply ());
        return res;
      });
}

Json::Value
RpcServer::getflag (const std::string& id)
{
  LOG (INFO) << "RPC method called: getflag " << id;
  const mflag::FlagId flagId = ParseFlagIdArg (id);

  return logic.GetCustomStateData (game,
      [&flagId] (const mflag::FlagViews& views)
      {
        if (!views.IsFlagRegistered (flagId))
          return Json::Value ();

        Json::Value res = mflag::FlagPairToJson (views.GetFlagPair (flagId));
        res["first_tokens"]
            = mflag::TokenIdsToJson (views.GetFirstTokenIds (flagId));
        res["second_tokens"]
            = mflag::TokenIdsToJson (views.GetSecondTokenIds (flagId));
        return res;
      });
}

Json::Value
RpcServer::getflagids ()
{
  LOG (INFO) << "RPC method called: getflagids";
  return logic.GetCustomStateData (game,
      [] (const mflag::FlagViews& views)
      {
        Json::Value res(Json::arrayValue);
        for (const auto& id : views.GetRegisteredFlagIds ())
          res.append (mflag::AmountToJson (id));
        return res;
      });
}

Json::Value
RpcServer::gettoken (const int id)
{
  LOG (INFO) << "RPC method called: gettoken " << id;
  if (id <= 0)
    throw jsonrpc::JsonRpcException (jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS,
                                     "invalid token ID");
  const mflag::TokenId tokenId = id;

  return logic.GetCustomStateData (game,
      [tokenId] (const mflag::FlagViews& views)
      {
        Json::Value res(Json::objectValue);
        try
          {
            res["id"] = static_cast<Json::Int64> (tokenId);
            res["owner"] = views.OwnerOf (tokenId);
            res["flag_id"]
                = mflag::AmountToJson (views.GetFlagIdForToken (tokenId));
            res["first"] = views.IsTokenFirstNft (tokenId);
            res["uri"] = views.TokenUri (tokenId);

            const mflag::Address approved = views.GetApproved (tokenId);
            if (!approved.empty ())
              res["approved"] = approved;
          }
        catch (const mflag::ContractError& exc)
          {
            VLOG (1) << "Token lookup failed: " << exc.what ();
            return Json::Value ();
          }

        return res;
      });
}

Json::Value
RpcServer::getownedtokens (const std::string& name)
{
  LOG (INFO) << "RPC method called: getownedtokens " << name;
  const mflag::Address owner = ParseNameArg (name);

  return logic.GetCustomStateData (game,
      [&owner] (const mflag::FlagViews& views)
      {
        return mflag::TokenIdsToJson (views.GetOwnedTokens (owner));
      });
}

Json::Value
RpcServer::getprice (const std::string& buyer, const std::string& id)
{
  LOG (INFO) << "RPC method called: getprice " << id << " " << buyer;
  const mflag::FlagId flagId = ParseFlagIdArg (id);
  const mflag::Address buyerAddr = ParseNameArg (buyer);

  return logic.GetCustomStateData (game,
      [&flagId, &buyerAddr] (const mflag::FlagViews& views)
      {
        if (!views.IsFlagRegistered (flagId))
          return Json::Value ();

        Json::Value res(Json::objectValue);
        res["per_nft"] = mflag::AmountToJson (
            views.DiscountedPricePerNft (flagId, buyerAddr));
        res["total"] = mflag::AmountToJson (
            views.TotalPriceWithDiscount (flagId, buyerAddr));
        res["nfts_required"]
            = static_cast<Json::Int64> (views.GetNftsRequired (flagId));
        return res;
      });
}

Json::Value
RpcServer::getdiscounttier (const std::string& name)
{
  LOG (INFO) << "RPC method called: getdiscounttier " << name;
  const mflag::Address user = ParseNameArg (name);

  return logic.GetCustomStateData (game,
      [&user] (const mflag::FlagViews& views)
      {
        Json::Value res(Json::objectValue);
        res["plus"] = views.UserHasPlus (user);
        res["premium"] = views.UserHasPremium (user);
        res["tier"] = static_cast<Json::Int64> (
            views.GetUserDiscountTier (user));
        return res;
      });
}

Json::Value
RpcServer::getbalance (const std::string& name)
{
  LOG (INFO) << "RPC method called: getbalance " << name;
  const mflag::Address user = ParseNameArg (name);

  return logic.GetCustomStateData (game,
      [&user] (const mflag::FlagViews& views)
      {
        return mflag::AmountToJson (views.GetNativeBalance (user));
      });
}

} // namespace mfg

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

#include "game.hpp"

#include "moveprocessor.hpp"
#include "params.hpp"

#include "chain.hpp"
#include "contract.hpp"
#include "json.hpp"
#include "state.hpp"

#include <glog/logging.h>

namespace mfg
{

namespace
{

/**
 * Logs all events emitted so far on the chain, and clears them.
 */
void
LogEvents (mflag::Chain& chain)
{
  for (const auto& ev : chain.TakeEvents ())
    LOG (INFO) << "Event: " << mflag::ProtoToJson (ev);
}

} // anonymous namespace

void
FlagsGame::SetupSchema (xaya::SQLiteDatabase& db)
{
  mflag::FlagContract::SetupSchema (db);
}

void
FlagsGame::GetInitialStateBlock (unsigned& height, std::string& hashHex) const
{
  const Params params(GetChain ());
  params.InitialBlock (height, hashHex);
}

void
FlagsGame::InitialiseState (xaya::SQLiteDatabase& db)
{
  const Params params(GetChain ());

  mflag::Chain chain(db, CONTRACT_ADDRESS);
  mflag::FlagContract contract(chain);
  contract.Deploy (PlayerAddress (params.AdminName ()),
                   params.InitialBaseUri ());

  LogEvents (chain);
}

void
FlagsGame::UpdateState (xaya::SQLiteDatabase& db, const Json::Value& blockData)
{
  const Params params(GetChain ());

  mflag::Chain chain(db, CONTRACT_ADDRESS);
  mflag::FlagContract contract(chain);

  VLOG (1)
      << "Processing block at height " << blockData["block"]["height"];

  MoveProcessor proc(chain, contract, params);
  proc.ProcessAll (blockData["moves"]);

  LogEvents (chain);
}

Json::Value
FlagsGame::GetStateAsJson (const xaya::SQLiteDatabase& db)
{
  const mflag::FlagViews views(db, CONTRACT_ADDRESS);

  Json::Value contract;
  const mflag::ContractState state(db);
  state.ReadState ([&contract] (const mflag::proto::Globals& g)
    {
      contract = mflag::ProtoToJson (g);
    });
  contract["name"] = mflag::FlagViews::NAME;
  contract["symbol"] = mflag::FlagViews::SYMBOL;
  contract["balance"] = mflag::AmountToJson (views.GetContractBalance ());
  contract["total_supply"]
      = static_cast<Json::Int64> (views.TotalSupply ());

  Json::Value flags(Json::arrayValue);
  for (const auto& id : views.GetRegisteredFlagIds ())
    flags.append (mflag::FlagPairToJson (views.GetFlagPair (id)));

  Json::Value res(Json::objectValue);
  res["contract"] = contract;
  res["flags"] = flags;

  return res;
}

Json::Value
FlagsGame::GetCustomStateData (const xaya::Game& game,
                               const StateCallback& cb)
{
  return SQLiteGame::GetCustomStateData (game, "data",
      [&cb] (const xaya::SQLiteDatabase& db)
      {
        const mflag::FlagViews views(db, CONTRACT_ADDRESS);
        return cb (views);
      });
}

} // namespace mfg

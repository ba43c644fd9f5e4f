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

#include "pending.hpp"

#include <glog/logging.h>

namespace mfg
{

namespace
{

/**
 * Converts one of the per-flag maps of names to JSON.
 */
Json::Value
NamesByFlagToJson (const std::map<mflag::FlagId,
                                  std::set<mflag::Address>>& data)
{
  Json::Value res(Json::objectValue);
  for (const auto& entry : data)
    {
      Json::Value names(Json::arrayValue);
      for (const auto& n : entry.second)
        names.append (n);
      res[mflag::AmountToString (entry.first)] = names;
    }

  return res;
}

} // anonymous namespace

void
PendingState::ProcessClaim (const mflag::Address& sender,
                            const mflag::FlagId& id)
{
  claims[id].insert (sender);
}

void
PendingState::ProcessPurchase (const mflag::Address& sender,
                               const mflag::FlagId& id)
{
  purchases[id].insert (sender);
}

void
PendingState::AddMove (const Json::Value& mv)
{
  ParseMove (mv);
}

void
PendingState::Clear ()
{
  claims.clear ();
  purchases.clear ();
}

Json::Value
PendingState::ToJson () const
{
  Json::Value res(Json::objectValue);
  res["claims"] = NamesByFlagToJson (claims);
  res["purchases"] = NamesByFlagToJson (purchases);
  return res;
}

void
PendingMoves::Clear ()
{
  state.Clear ();
}

Json::Value
PendingMoves::ToJson () const
{
  return state.ToJson ();
}

void
PendingMoves::AddPendingMove (const Json::Value& mv)
{
  VLOG (1) << "Pending move: " << mv;
  state.AddMove (mv);
}

} // namespace mfg

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

#ifndef MFLAG_GSP_PENDING_HPP
#define MFLAG_GSP_PENDING_HPP

#include "moveprocessor.hpp"

#include <xayagame/pendingmoves.hpp>

#include <json/json.h>

#include <map>
#include <set>

namespace mfg
{

/**
 * The currently pending claims and purchases, keyed by flag ID.
 */
class PendingState : private MoveParser
{

private:

  /** Names with a pending claim, per flag.  */
  std::map<mflag::FlagId, std::set<mflag::Address>> claims;

  /** Names with a pending purchase, per flag.  */
  std::map<mflag::FlagId, std::set<mflag::Address>> purchases;

protected:

  void ProcessClaim (const mflag::Address& sender,
                     const mflag::FlagId& id) override;
  void ProcessPurchase (const mflag::Address& sender,
                        const mflag::FlagId& id) override;

public:

  PendingState () = default;

  /**
   * Adds the operations from a pending move.
   */
  void AddMove (const Json::Value& mv);

  void Clear ();

  Json::Value ToJson () const;

};

/**
 * Tracker for pending moves in the flag GSP.
 */
class PendingMoves : public xaya::PendingMoveProcessor
{

private:

  /** The current pending state.  */
  PendingState state;

protected:

  void Clear () override;
  void AddPendingMove (const Json::Value& mv) override;

public:

  PendingMoves () = default;

  Json::Value ToJson () const override;

};

} // namespace mfg

#endif // MFLAG_GSP_PENDING_HPP

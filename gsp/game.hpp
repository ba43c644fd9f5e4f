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

#ifndef MFLAG_GSP_GAME_HPP
#define MFLAG_GSP_GAME_HPP

#include "views.hpp"

#include <xayagame/game.hpp>
#include <xayagame/sqlitegame.hpp>

#include <json/json.h>

#include <functional>
#include <string>

namespace mfg
{

/**
 * SQLiteGame instance for the flag GSP.  The game state is the state of
 * the flag contract, which is deployed at the initial block and then
 * driven by the moves of each block.
 */
class FlagsGame : public xaya::SQLiteGame
{

protected:

  void SetupSchema (xaya::SQLiteDatabase& db) override;
  void GetInitialStateBlock (unsigned& height,
                             std::string& hashHex) const override;

  void InitialiseState (xaya::SQLiteDatabase& db) override;
  void UpdateState (xaya::SQLiteDatabase& db,
                    const Json::Value& blockData) override;

  Json::Value GetStateAsJson (const xaya::SQLiteDatabase& db) override;

public:

  /**
   * Type for a callback that extracts custom JSON from the game state
   * through the contract's views.
   */
  using StateCallback
      = std::function<Json::Value (const mflag::FlagViews& views)>;

  FlagsGame () = default;

  FlagsGame (const FlagsGame&) = delete;
  void operator= (const FlagsGame&) = delete;

  /**
   * Extracts some custom JSON from the current game state, using the
   * provided callback on the contract views.  The result is returned
   * in the "data" field.
   */
  Json::Value GetCustomStateData (const xaya::Game& game,
                                  const StateCallback& cb);

};

} // namespace mfg

#endif // MFLAG_GSP_GAME_HPP

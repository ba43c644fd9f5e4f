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

#ifndef MFLAG_GSP_PARAMS_HPP
#define MFLAG_GSP_PARAMS_HPP

#include "amount.hpp"

#include <xayagame/gamelogic.hpp>

#include <string>

namespace mfg
{

/** The game ID under which moves are sent.  */
constexpr const char* GAME_ID = "mf";

/** The address of the contract in the game state.  */
constexpr const char* CONTRACT_ADDRESS = "g/mf";

/**
 * Returns the contract address (as used in the game state) of
 * a Xaya name given without namespace.
 */
mflag::Address PlayerAddress (const std::string& name);

/**
 * Consensus parameters of the GSP, which depend on the chain it is
 * running on.
 */
class Params
{

private:

  /** The chain for which we need parameters.  */
  const xaya::Chain chain;

public:

  explicit Params (const xaya::Chain c)
    : chain(c)
  {}

  Params () = delete;
  Params (const Params&) = delete;
  void operator= (const Params&) = delete;

  /**
   * Returns the block at which the game state starts.
   */
  void InitialBlock (unsigned& height, std::string& hashHex) const;

  /**
   * Returns the Xaya name (without "p/") that deploys the contract and
   * is its initial admin.
   */
  std::string AdminName () const;

  /**
   * Returns the CHI address to which purchases have to be paid.
   */
  std::string PaymentAddress () const;

  /**
   * Returns the base URI the contract is deployed with.
   */
  std::string InitialBaseUri () const;

};

} // namespace mfg

#endif // MFLAG_GSP_PARAMS_HPP

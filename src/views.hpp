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

#ifndef MFLAG_VIEWS_HPP
#define MFLAG_VIEWS_HPP

#include "amount.hpp"
#include "pricing.hpp"
#include "registry.hpp"
#include "state.hpp"
#include "tokens.hpp"

#include <xayagame/sqlitestorage.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace mflag
{

/**
 * All read-only queries of the contract.  They work on a const database,
 * so that they can be used directly e.g. from RPC methods reading the
 * current game state.  Failures are reported by throwing ContractError.
 */
class FlagViews
{

protected:

  /** The contract's own address.  */
  const Address self;

  const xaya::SQLiteDatabase& db;

  FlagStore flags;
  TokenStore tokens;
  DiscountStore discounts;
  ContractState state;

  /**
   * Looks up a flag, throwing NotRegistered if it is unknown.
   */
  FlagPair RequireFlag (const FlagId& id) const;

  /**
   * Returns the owner of a token, throwing NotFound if it does not exist.
   */
  Address RequireOwner (TokenId id) const;

public:

  /** Name of the token collection.  */
  static constexpr const char* NAME = "Municipal Flag NFT";

  /** Symbol of the token collection.  */
  static constexpr const char* SYMBOL = "MFLAG";

  explicit FlagViews (const xaya::SQLiteDatabase& d, const Address& s);

  FlagViews () = delete;
  FlagViews (const FlagViews&) = delete;
  void operator= (const FlagViews&) = delete;

  /* Registry.  */

  FlagPair GetFlagPair (const FlagId& id) const;
  bool IsFlagRegistered (const FlagId& id) const;
  std::vector<TokenId> GetFirstTokenIds (const FlagId& id) const;
  std::vector<TokenId> GetSecondTokenIds (const FlagId& id) const;
  unsigned GetNftsRequired (const FlagId& id) const;
  uint64_t GetTotalRegisteredFlags () const;
  std::vector<FlagId> GetRegisteredFlagIds () const;

  /* Discounts and pricing.  */

  bool UserHasPlus (const Address& a) const;
  bool UserHasPremium (const Address& a) const;
  Tier GetUserDiscountTier (const Address& a) const;

  /**
   * Returns the price per token the given buyer has to pay for the second
   * phase of a flag.
   */
  Amount DiscountedPricePerNft (const FlagId& id, const Address& buyer) const;

  Amount
  GetPriceWithDiscount (const FlagId& id, const Address& buyer) const
  {
    return DiscountedPricePerNft (id, buyer);
  }

  /**
   * Returns the total payment due for the second phase of a flag, i.e. the
   * discounted per-token price times the number of tokens.
   */
  Amount TotalPriceWithDiscount (const FlagId& id, const Address& buyer) const;

  /* Token back-references.  */

  FlagId GetFlagIdForToken (TokenId id) const;
  bool IsTokenFirstNft (TokenId id) const;

  uint64_t GetTotalTokensMinted () const;
  Amount GetContractBalance () const;

  /**
   * Returns the native ledger balance of any address.
   */
  Amount GetNativeBalance (const Address& a) const;

  /* Contract globals.  */

  Address GetOwner () const;
  std::string GetBaseUri () const;

  /* Standard token surface.  */

  uint64_t BalanceOf (const Address& owner) const;
  Address OwnerOf (TokenId id) const;
  uint64_t TotalSupply () const;
  TokenId TokenByIndex (uint64_t index) const;
  TokenId TokenOfOwnerByIndex (const Address& owner, uint64_t index) const;

  /**
   * Returns all tokens of an owner, in the order of their index in the
   * owner's enumeration.
   */
  std::vector<TokenId> GetOwnedTokens (const Address& owner) const;

  Address GetApproved (TokenId id) const;
  bool IsApprovedForAll (const Address& owner, const Address& op) const;

  /**
   * Returns the metadata URI of a token, which is the base URI followed
   * by the decimal token ID and ".json".  If no base URI is set, the result
   * is empty.
   */
  std::string TokenUri (TokenId id) const;

  /**
   * Returns true if the given ERC-165 interface ID is implemented.
   */
  static bool SupportsInterface (uint32_t interfaceId);

};

} // namespace mflag

#endif // MFLAG_VIEWS_HPP

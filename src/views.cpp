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

#include "views.hpp"

#include "chain.hpp"
#include "errors.hpp"

#include <glog/logging.h>

namespace mflag
{

namespace
{

/**
 * The interfaces we report as supported.
 */
constexpr uint32_t SUPPORTED_INTERFACES[] =
  {
    0x01ffc9a7, /* ERC-165 */
    0x80ac58cd, /* ERC-721 */
    0x5b5e139f, /* ERC-721 metadata */
    0x780e9d63, /* ERC-721 enumerable */
    0x49064906, /* ERC-4906 metadata update */
  };

} // anonymous namespace

FlagViews::FlagViews (const xaya::SQLiteDatabase& d, const Address& s)
  : self(s), db(d),
    flags(d), tokens(d), discounts(d), state(d)
{}

FlagPair
FlagViews::RequireFlag (const FlagId& id) const
{
  FlagPair res;
  if (!flags.Get (id, res))
    throw ContractError (ErrorKind::NOT_REGISTERED, {AmountToString (id)});
  return res;
}

Address
FlagViews::RequireOwner (const TokenId id) const
{
  Address res;
  if (!tokens.GetOwner (id, res))
    throw ContractError (ErrorKind::NOT_FOUND, {IntToString (id)});
  return res;
}

FlagPair
FlagViews::GetFlagPair (const FlagId& id) const
{
  return RequireFlag (id);
}

bool
FlagViews::IsFlagRegistered (const FlagId& id) const
{
  return flags.IsRegistered (id);
}

std::vector<TokenId>
FlagViews::GetFirstTokenIds (const FlagId& id) const
{
  RequireFlag (id);
  return tokens.GetFlagTokens (id, true);
}

std::vector<TokenId>
FlagViews::GetSecondTokenIds (const FlagId& id) const
{
  RequireFlag (id);
  return tokens.GetFlagTokens (id, false);
}

unsigned
FlagViews::GetNftsRequired (const FlagId& id) const
{
  return RequireFlag (id).nftsRequired;
}

uint64_t
FlagViews::GetTotalRegisteredFlags () const
{
  return flags.Count ();
}

std::vector<FlagId>
FlagViews::GetRegisteredFlagIds () const
{
  return flags.GetIds ();
}

bool
FlagViews::UserHasPlus (const Address& a) const
{
  return discounts.Get (a).hasPlus;
}

bool
FlagViews::UserHasPremium (const Address& a) const
{
  return discounts.Get (a).hasPremium;
}

Tier
FlagViews::GetUserDiscountTier (const Address& a) const
{
  return discounts.Get (a).GetTier ();
}

Amount
FlagViews::DiscountedPricePerNft (const FlagId& id, const Address& buyer) const
{
  const FlagPair f = RequireFlag (id);
  return DiscountedPrice (f.category, f.price, discounts.Get (buyer));
}

Amount
FlagViews::TotalPriceWithDiscount (const FlagId& id,
                                   const Address& buyer) const
{
  const FlagPair f = RequireFlag (id);
  const Amount perNft = DiscountedPrice (f.category, f.price,
                                         discounts.Get (buyer));
  return perNft * f.nftsRequired;
}

FlagId
FlagViews::GetFlagIdForToken (const TokenId id) const
{
  FlagId res;
  bool first;
  if (!tokens.GetFlag (id, res, first))
    throw ContractError (ErrorKind::NOT_FOUND, {IntToString (id)});
  return res;
}

bool
FlagViews::IsTokenFirstNft (const TokenId id) const
{
  FlagId flag;
  bool res;
  if (!tokens.GetFlag (id, flag, res))
    throw ContractError (ErrorKind::NOT_FOUND, {IntToString (id)});
  return res;
}

uint64_t
FlagViews::GetTotalTokensMinted () const
{
  uint64_t res;
  state.ReadState ([&res] (const proto::Globals& data)
    {
      res = data.token_counter ();
    });
  return res;
}

Amount
FlagViews::GetContractBalance () const
{
  return GetLedgerBalance (db, self);
}

Amount
FlagViews::GetNativeBalance (const Address& a) const
{
  return GetLedgerBalance (db, a);
}

Address
FlagViews::GetOwner () const
{
  Address res;
  state.ReadState ([&res] (const proto::Globals& data)
    {
      res = data.owner ();
    });
  return res;
}

std::string
FlagViews::GetBaseUri () const
{
  std::string res;
  state.ReadState ([&res] (const proto::Globals& data)
    {
      res = data.base_uri ();
    });
  return res;
}

uint64_t
FlagViews::BalanceOf (const Address& owner) const
{
  if (owner.empty ())
    throw ContractError (ErrorKind::INVALID_OWNER, {owner});
  return tokens.GetBalance (owner);
}

Address
FlagViews::OwnerOf (const TokenId id) const
{
  return RequireOwner (id);
}

uint64_t
FlagViews::TotalSupply () const
{
  return tokens.GetTotalSupply ();
}

TokenId
FlagViews::TokenByIndex (const uint64_t index) const
{
  TokenId res;
  if (!tokens.GetByIndex (index, res))
    throw ContractError (ErrorKind::OUT_OF_BOUNDS_INDEX,
                         {"", IntToString (index)});
  return res;
}

TokenId
FlagViews::TokenOfOwnerByIndex (const Address& owner,
                                const uint64_t index) const
{
  TokenId res;
  if (!tokens.GetOfOwnerByIndex (owner, index, res))
    throw ContractError (ErrorKind::OUT_OF_BOUNDS_INDEX,
                         {owner, IntToString (index)});
  return res;
}

std::vector<TokenId>
FlagViews::GetOwnedTokens (const Address& owner) const
{
  return tokens.GetOwnedTokens (owner);
}

Address
FlagViews::GetApproved (const TokenId id) const
{
  RequireOwner (id);
  return tokens.GetApproved (id);
}

bool
FlagViews::IsApprovedForAll (const Address& owner, const Address& op) const
{
  return tokens.IsApprovedForAll (owner, op);
}

std::string
FlagViews::TokenUri (const TokenId id) const
{
  RequireOwner (id);

  const std::string base = GetBaseUri ();
  if (base.empty ())
    return "";

  return base + IntToString (id) + ".json";
}

bool
FlagViews::SupportsInterface (const uint32_t interfaceId)
{
  for (const auto supported : SUPPORTED_INTERFACES)
    if (supported == interfaceId)
      return true;
  return false;
}

} // namespace mflag

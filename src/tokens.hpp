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

#ifndef MFLAG_TOKENS_HPP
#define MFLAG_TOKENS_HPP

#include "amount.hpp"

#include <xayagame/sqlitestorage.hpp>

#include <cstdint>
#include <vector>

namespace mflag
{

/**
 * Database access to minted tokens:  their ownership (with a dense
 * per-owner index for enumeration), approvals and the back-reference
 * of each token to the flag and phase it was minted for.
 */
class TokenStore
{

private:

  /** The database for writes, or null if this is read-only.  */
  xaya::SQLiteDatabase* mutableDb;

  /** The database for reading.  */
  const xaya::SQLiteDatabase& db;

  xaya::SQLiteDatabase& GetMutable ();

public:

  explicit TokenStore (xaya::SQLiteDatabase& d)
    : mutableDb(&d), db(d)
  {}

  explicit TokenStore (const xaya::SQLiteDatabase& d)
    : mutableDb(nullptr), db(d)
  {}

  TokenStore () = delete;
  TokenStore (const TokenStore&) = delete;
  void operator= (const TokenStore&) = delete;

  static void SetupSchema (xaya::SQLiteDatabase& db);

  /**
   * Looks up the owner of a token.  Returns false if it does not exist.
   */
  bool GetOwner (TokenId id, Address& owner) const;

  bool
  Exists (const TokenId id) const
  {
    Address owner;
    return GetOwner (id, owner);
  }

  /**
   * Returns the number of tokens owned by an address.
   */
  uint64_t GetBalance (const Address& owner) const;

  uint64_t GetTotalSupply () const;

  /**
   * Looks up the n-th token overall (in order of IDs).  Returns false
   * if the index is out of range.
   */
  bool GetByIndex (uint64_t index, TokenId& id) const;

  /**
   * Looks up the n-th token of a given owner.  Returns false if the index
   * is out of range.
   */
  bool GetOfOwnerByIndex (const Address& owner, uint64_t index,
                          TokenId& id) const;

  /**
   * Returns all tokens of an owner, in the order of the owner index.
   */
  std::vector<TokenId> GetOwnedTokens (const Address& owner) const;

  /**
   * Returns the approved address for a token, which is the zero address
   * if there is none.
   */
  Address GetApproved (TokenId id) const;

  void SetApproved (TokenId id, const Address& approved);

  bool IsApprovedForAll (const Address& owner, const Address& op) const;

  void SetApprovalForAll (const Address& owner, const Address& op,
                          bool approved);

  /**
   * Creates a new token with the given owner.  The ID must not exist yet.
   */
  void Mint (TokenId id, const Address& to);

  /**
   * Changes the owner of an existing token.  This clears its approval.
   */
  void Move (TokenId id, const Address& to);

  /**
   * Records the flag and phase a token belongs to.
   */
  void SetFlag (TokenId id, const FlagId& flag, bool first);

  /**
   * Looks up the flag and phase of a token.  Returns false if the token
   * does not exist or has no flag reference (yet).
   */
  bool GetFlag (TokenId id, FlagId& flag, bool& first) const;

  /**
   * Returns the tokens minted in one of the phases for a flag,
   * ordered by ID.
   */
  std::vector<TokenId> GetFlagTokens (const FlagId& flag, bool first) const;

};

} // namespace mflag

#endif // MFLAG_TOKENS_HPP

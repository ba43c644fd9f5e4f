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

#ifndef MFLAG_REGISTRY_HPP
#define MFLAG_REGISTRY_HPP

#include "amount.hpp"

#include <xayagame/sqlitestorage.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace mflag
{

/**
 * The category of a flag, which determines its discount behaviour.
 */
enum class Category
{
  STANDARD = 0,
  PLUS = 1,
  PREMIUM = 2,
};

/** Maximum number of tokens minted per phase for a single flag.  */
constexpr unsigned MAX_NFTS_REQUIRED = 10;

/**
 * Converts a category number from a registration tuple to the enum value.
 * Returns false if the number is not a valid category.
 */
bool CategoryFromInt (unsigned c, Category& res);

/**
 * The full record of a registered flag.
 */
struct FlagPair
{

  FlagId id;

  Category category = Category::STANDARD;

  /** Price per single second-phase token.  */
  Amount price;

  /** Number of tokens minted in each phase.  */
  unsigned nftsRequired = 1;

  bool firstMinted = false;
  bool secondMinted = false;
  bool pairComplete = false;

  /**
   * The original claimer and buyer.  They are not updated when the
   * tokens are transferred later on.
   */
  Address firstOwner;
  Address secondOwner;

  unsigned firstMintedCount = 0;
  unsigned secondMintedCount = 0;

  /** Lowest token ID minted in each phase, zero if none yet.  */
  TokenId firstTokenId = 0;
  TokenId secondTokenId = 0;

  std::string metadataHash;

};

/**
 * Database access to the flag registry.  Instances constructed from a const
 * database can only be used for reading.
 */
class FlagStore
{

private:

  /** The database for writes, or null if this is read-only.  */
  xaya::SQLiteDatabase* mutableDb;

  /** The database for reading.  */
  const xaya::SQLiteDatabase& db;

public:

  explicit FlagStore (xaya::SQLiteDatabase& d)
    : mutableDb(&d), db(d)
  {}

  explicit FlagStore (const xaya::SQLiteDatabase& d)
    : mutableDb(nullptr), db(d)
  {}

  FlagStore () = delete;
  FlagStore (const FlagStore&) = delete;
  void operator= (const FlagStore&) = delete;

  static void SetupSchema (xaya::SQLiteDatabase& db);

  bool IsRegistered (const FlagId& id) const;

  /**
   * Looks up a flag.  Returns false if it is not registered.
   */
  bool Get (const FlagId& id, FlagPair& res) const;

  /**
   * Adds a new flag.  It must not be registered yet.  The flag is appended
   * to the end of the registration order.
   */
  void Insert (const FlagPair& f);

  /**
   * Writes back the mutable fields of an existing flag.
   */
  void Update (const FlagPair& f);

  /**
   * Returns the number of registered flags.
   */
  uint64_t Count () const;

  /**
   * Returns all registered flag IDs in the order of registration.
   */
  std::vector<FlagId> GetIds () const;

};

} // namespace mflag

#endif // MFLAG_REGISTRY_HPP

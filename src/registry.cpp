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

#include "registry.hpp"

#include <glog/logging.h>

namespace mflag
{

bool
CategoryFromInt (const unsigned c, Category& res)
{
  switch (c)
    {
    case 0:
      res = Category::STANDARD;
      return true;
    case 1:
      res = Category::PLUS;
      return true;
    case 2:
      res = Category::PREMIUM;
      return true;
    default:
      return false;
    }
}

namespace
{

/**
 * Binds the mutable fields of a flag to a statement, starting at
 * the given index.
 */
void
BindMutableFields (xaya::SQLiteDatabase::Statement& stmt, const int start,
                   const FlagPair& f)
{
  stmt.Bind (start, f.firstMinted ? 1 : 0);
  stmt.Bind (start + 1, f.secondMinted ? 1 : 0);
  stmt.Bind (start + 2, f.pairComplete ? 1 : 0);
  stmt.Bind (start + 3, f.firstOwner);
  stmt.Bind (start + 4, f.secondOwner);
  stmt.Bind (start + 5, static_cast<int> (f.firstMintedCount));
  stmt.Bind (start + 6, static_cast<int> (f.secondMintedCount));
  stmt.Bind (start + 7, static_cast<int64_t> (f.firstTokenId));
  stmt.Bind (start + 8, static_cast<int64_t> (f.secondTokenId));
  stmt.Bind (start + 9, f.metadataHash);
}

} // anonymous namespace

void
FlagStore::SetupSchema (xaya::SQLiteDatabase& db)
{
  /* Flag IDs are 256-bit numbers, which we store as decimal strings.
     The registration order is kept explicitly in `seq`.  */
  db.Execute (R"(
    CREATE TABLE IF NOT EXISTS `flags` (
      `id` TEXT NOT NULL PRIMARY KEY,
      `seq` INTEGER NOT NULL UNIQUE,
      `category` INTEGER NOT NULL,
      `price` TEXT NOT NULL,
      `nfts_required` INTEGER NOT NULL,
      `first_minted` INTEGER NOT NULL,
      `second_minted` INTEGER NOT NULL,
      `pair_complete` INTEGER NOT NULL,
      `first_owner` TEXT NOT NULL,
      `second_owner` TEXT NOT NULL,
      `first_count` INTEGER NOT NULL,
      `second_count` INTEGER NOT NULL,
      `first_token` INTEGER NOT NULL,
      `second_token` INTEGER NOT NULL,
      `metadata_hash` TEXT NOT NULL
    )
  )");
}

bool
FlagStore::IsRegistered (const FlagId& id) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT COUNT(*)
      FROM `flags`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, AmountToString (id));

  CHECK (stmt.Step ());
  const bool res = stmt.Get<int64_t> (0) > 0;
  CHECK (!stmt.Step ());

  return res;
}

bool
FlagStore::Get (const FlagId& id, FlagPair& res) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `category`, `price`, `nfts_required`,
           `first_minted`, `second_minted`, `pair_complete`,
           `first_owner`, `second_owner`,
           `first_count`, `second_count`,
           `first_token`, `second_token`,
           `metadata_hash`
      FROM `flags`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, AmountToString (id));

  if (!stmt.Step ())
    return false;

  res.id = id;
  CHECK (CategoryFromInt (stmt.Get<int> (0), res.category));
  CHECK (AmountFromString (stmt.Get<std::string> (1), res.price));
  res.nftsRequired = stmt.Get<int> (2);
  res.firstMinted = (stmt.Get<int> (3) != 0);
  res.secondMinted = (stmt.Get<int> (4) != 0);
  res.pairComplete = (stmt.Get<int> (5) != 0);
  res.firstOwner = stmt.Get<std::string> (6);
  res.secondOwner = stmt.Get<std::string> (7);
  res.firstMintedCount = stmt.Get<int> (8);
  res.secondMintedCount = stmt.Get<int> (9);
  res.firstTokenId = stmt.Get<int64_t> (10);
  res.secondTokenId = stmt.Get<int64_t> (11);
  res.metadataHash = stmt.Get<std::string> (12);

  CHECK (!stmt.Step ());
  return true;
}

void
FlagStore::Insert (const FlagPair& f)
{
  CHECK (mutableDb != nullptr) << "Insert on read-only flag store";
  CHECK (!IsRegistered (f.id)) << "Flag " << AmountToString (f.id)
                               << " is already registered";

  auto stmt = mutableDb->Prepare (R"(
    INSERT INTO `flags`
      (`id`, `seq`, `category`, `price`, `nfts_required`,
       `first_minted`, `second_minted`, `pair_complete`,
       `first_owner`, `second_owner`,
       `first_count`, `second_count`,
       `first_token`, `second_token`,
       `metadata_hash`)
      VALUES (?1, ?2, ?3, ?4, ?5,
              ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15)
  )");

  stmt.Bind (1, AmountToString (f.id));
  stmt.Bind (2, static_cast<int64_t> (Count ()));
  stmt.Bind (3, static_cast<int> (f.category));
  stmt.Bind (4, AmountToString (f.price));
  stmt.Bind (5, static_cast<int> (f.nftsRequired));
  BindMutableFields (stmt, 6, f);
  stmt.Execute ();
}

void
FlagStore::Update (const FlagPair& f)
{
  CHECK (mutableDb != nullptr) << "Update on read-only flag store";

  auto stmt = mutableDb->Prepare (R"(
    UPDATE `flags`
      SET `first_minted` = ?2, `second_minted` = ?3, `pair_complete` = ?4,
          `first_owner` = ?5, `second_owner` = ?6,
          `first_count` = ?7, `second_count` = ?8,
          `first_token` = ?9, `second_token` = ?10,
          `metadata_hash` = ?11
      WHERE `id` = ?1
  )");

  stmt.Bind (1, AmountToString (f.id));
  BindMutableFields (stmt, 2, f);
  stmt.Execute ();
}

uint64_t
FlagStore::Count () const
{
  auto stmt = db.PrepareRo (R"(
    SELECT COUNT(*)
      FROM `flags`
  )");

  CHECK (stmt.Step ());
  const auto res = stmt.Get<int64_t> (0);
  CHECK (!stmt.Step ());

  return res;
}

std::vector<FlagId>
FlagStore::GetIds () const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `id`
      FROM `flags`
      ORDER BY `seq`
  )");

  std::vector<FlagId> res;
  while (stmt.Step ())
    {
      FlagId id;
      CHECK (AmountFromString (stmt.Get<std::string> (0), id));
      res.push_back (id);
    }

  return res;
}

} // namespace mflag

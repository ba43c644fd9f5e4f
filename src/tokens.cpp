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

#include "tokens.hpp"

#include <glog/logging.h>

namespace mflag
{

void
TokenStore::SetupSchema (xaya::SQLiteDatabase& db)
{
  /* The owner index is a dense numbering 0..n-1 of the tokens of each
     owner, used for enumeration.  The flag and phase columns are filled in
     right after minting.  */
  db.Execute (R"(
    CREATE TABLE IF NOT EXISTS `tokens` (
      `id` INTEGER NOT NULL PRIMARY KEY,
      `owner` TEXT NOT NULL,
      `owner_index` INTEGER NOT NULL,
      `approved` TEXT NULL,
      `flag` TEXT NULL,
      `first` INTEGER NULL
    );
    CREATE UNIQUE INDEX IF NOT EXISTS `tokens_by_owner`
      ON `tokens` (`owner`, `owner_index`);
    CREATE INDEX IF NOT EXISTS `tokens_by_flag`
      ON `tokens` (`flag`, `first`);

    CREATE TABLE IF NOT EXISTS `operator_approvals` (
      `owner` TEXT NOT NULL,
      `operator` TEXT NOT NULL,
      PRIMARY KEY (`owner`, `operator`)
    );
  )");
}

xaya::SQLiteDatabase&
TokenStore::GetMutable ()
{
  CHECK (mutableDb != nullptr) << "Write to read-only token store";
  return *mutableDb;
}

bool
TokenStore::GetOwner (const TokenId id, Address& owner) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `owner`
      FROM `tokens`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, static_cast<int64_t> (id));

  if (!stmt.Step ())
    return false;

  owner = stmt.Get<std::string> (0);
  CHECK (!stmt.Step ());
  return true;
}

uint64_t
TokenStore::GetBalance (const Address& owner) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT COUNT(*)
      FROM `tokens`
      WHERE `owner` = ?1
  )");
  stmt.Bind (1, owner);

  CHECK (stmt.Step ());
  const auto res = stmt.Get<int64_t> (0);
  CHECK (!stmt.Step ());

  return res;
}

uint64_t
TokenStore::GetTotalSupply () const
{
  auto stmt = db.PrepareRo (R"(
    SELECT COUNT(*)
      FROM `tokens`
  )");

  CHECK (stmt.Step ());
  const auto res = stmt.Get<int64_t> (0);
  CHECK (!stmt.Step ());

  return res;
}

bool
TokenStore::GetByIndex (const uint64_t index, TokenId& id) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `id`
      FROM `tokens`
      ORDER BY `id`
      LIMIT 1 OFFSET ?1
  )");
  stmt.Bind (1, static_cast<int64_t> (index));

  if (!stmt.Step ())
    return false;

  id = stmt.Get<int64_t> (0);
  CHECK (!stmt.Step ());
  return true;
}

bool
TokenStore::GetOfOwnerByIndex (const Address& owner, const uint64_t index,
                               TokenId& id) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `id`
      FROM `tokens`
      WHERE `owner` = ?1 AND `owner_index` = ?2
  )");
  stmt.Bind (1, owner);
  stmt.Bind (2, static_cast<int64_t> (index));

  if (!stmt.Step ())
    return false;

  id = stmt.Get<int64_t> (0);
  CHECK (!stmt.Step ());
  return true;
}

std::vector<TokenId>
TokenStore::GetOwnedTokens (const Address& owner) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `id`
      FROM `tokens`
      WHERE `owner` = ?1
      ORDER BY `owner_index`
  )");
  stmt.Bind (1, owner);

  std::vector<TokenId> res;
  while (stmt.Step ())
    res.push_back (stmt.Get<int64_t> (0));

  return res;
}

Address
TokenStore::GetApproved (const TokenId id) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `approved`
      FROM `tokens`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, static_cast<int64_t> (id));

  if (!stmt.Step ())
    return "";

  Address res;
  if (!stmt.IsNull (0))
    res = stmt.Get<std::string> (0);
  CHECK (!stmt.Step ());

  return res;
}

void
TokenStore::SetApproved (const TokenId id, const Address& approved)
{
  auto stmt = GetMutable ().Prepare (R"(
    UPDATE `tokens`
      SET `approved` = ?2
      WHERE `id` = ?1
  )");
  stmt.Bind (1, static_cast<int64_t> (id));
  if (approved.empty ())
    stmt.BindNull (2);
  else
    stmt.Bind (2, approved);
  stmt.Execute ();
}

bool
TokenStore::IsApprovedForAll (const Address& owner, const Address& op) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT COUNT(*)
      FROM `operator_approvals`
      WHERE `owner` = ?1 AND `operator` = ?2
  )");
  stmt.Bind (1, owner);
  stmt.Bind (2, op);

  CHECK (stmt.Step ());
  const bool res = stmt.Get<int64_t> (0) > 0;
  CHECK (!stmt.Step ());

  return res;
}

void
TokenStore::SetApprovalForAll (const Address& owner, const Address& op,
                               const bool approved)
{
  if (approved)
    {
      auto stmt = GetMutable ().Prepare (R"(
        INSERT OR IGNORE INTO `operator_approvals`
          (`owner`, `operator`)
          VALUES (?1, ?2)
      )");
      stmt.Bind (1, owner);
      stmt.Bind (2, op);
      stmt.Execute ();
      return;
    }

  auto stmt = GetMutable ().Prepare (R"(
    DELETE FROM `operator_approvals`
      WHERE `owner` = ?1 AND `operator` = ?2
  )");
  stmt.Bind (1, owner);
  stmt.Bind (2, op);
  stmt.Execute ();
}

void
TokenStore::Mint (const TokenId id, const Address& to)
{
  CHECK (!Exists (id)) << "Token " << id << " exists already";
  const uint64_t index = GetBalance (to);

  auto stmt = GetMutable ().Prepare (R"(
    INSERT INTO `tokens`
      (`id`, `owner`, `owner_index`)
      VALUES (?1, ?2, ?3)
  )");
  stmt.Bind (1, static_cast<int64_t> (id));
  stmt.Bind (2, to);
  stmt.Bind (3, static_cast<int64_t> (index));
  stmt.Execute ();
}

void
TokenStore::Move (const TokenId id, const Address& to)
{
  auto& mdb = GetMutable ();

  int64_t oldIndex;
  Address from;
  {
    auto stmt = mdb.PrepareRo (R"(
      SELECT `owner`, `owner_index`
        FROM `tokens`
        WHERE `id` = ?1
    )");
    stmt.Bind (1, static_cast<int64_t> (id));
    CHECK (stmt.Step ()) << "Token " << id << " does not exist";
    from = stmt.Get<std::string> (0);
    oldIndex = stmt.Get<int64_t> (1);
    CHECK (!stmt.Step ());
  }

  if (from == to)
    {
      SetApproved (id, "");
      return;
    }

  const uint64_t newIndex = GetBalance (to);
  const int64_t lastIndex = GetBalance (from) - 1;

  /* Take the token out of the old owner's index first, so that the
     unique (owner, index) constraint holds at every step.  */
  {
    auto stmt = mdb.Prepare (R"(
      UPDATE `tokens`
        SET `owner` = ?2, `owner_index` = ?3, `approved` = NULL
        WHERE `id` = ?1
    )");
    stmt.Bind (1, static_cast<int64_t> (id));
    stmt.Bind (2, to);
    stmt.Bind (3, static_cast<int64_t> (newIndex));
    stmt.Execute ();
  }

  if (oldIndex != lastIndex)
    {
      auto stmt = mdb.Prepare (R"(
        UPDATE `tokens`
          SET `owner_index` = ?3
          WHERE `owner` = ?1 AND `owner_index` = ?2
      )");
      stmt.Bind (1, from);
      stmt.Bind (2, lastIndex);
      stmt.Bind (3, oldIndex);
      stmt.Execute ();
    }
}

void
TokenStore::SetFlag (const TokenId id, const FlagId& flag, const bool first)
{
  auto stmt = GetMutable ().Prepare (R"(
    UPDATE `tokens`
      SET `flag` = ?2, `first` = ?3
      WHERE `id` = ?1
  )");
  stmt.Bind (1, static_cast<int64_t> (id));
  stmt.Bind (2, AmountToString (flag));
  stmt.Bind (3, first ? 1 : 0);
  stmt.Execute ();
}

bool
TokenStore::GetFlag (const TokenId id, FlagId& flag, bool& first) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `flag`, `first`
      FROM `tokens`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, static_cast<int64_t> (id));

  if (!stmt.Step ())
    return false;

  if (stmt.IsNull (0))
    {
      CHECK (!stmt.Step ());
      return false;
    }

  CHECK (AmountFromString (stmt.Get<std::string> (0), flag));
  first = (stmt.Get<int> (1) != 0);
  CHECK (!stmt.Step ());

  return true;
}

std::vector<TokenId>
TokenStore::GetFlagTokens (const FlagId& flag, const bool first) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `id`
      FROM `tokens`
      WHERE `flag` = ?1 AND `first` = ?2
      ORDER BY `id`
  )");
  stmt.Bind (1, AmountToString (flag));
  stmt.Bind (2, first ? 1 : 0);

  std::vector<TokenId> res;
  while (stmt.Step ())
    res.push_back (stmt.Get<int64_t> (0));

  return res;
}

} // namespace mflag

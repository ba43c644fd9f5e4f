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

#include "state.hpp"

#include <glog/logging.h>

namespace mflag
{

void
ContractState::SetupSchema (xaya::SQLiteDatabase& db)
{
  db.Execute (R"(
    CREATE TABLE IF NOT EXISTS `globals` (
      `id` INTEGER NOT NULL PRIMARY KEY,
      `data` BLOB NOT NULL
    )
  )");
}

bool
ContractState::IsInitialised () const
{
  auto stmt = db.PrepareRo (R"(
    SELECT COUNT(*)
      FROM `globals`
  )");

  CHECK (stmt.Step ());
  const bool res = stmt.Get<int64_t> (0) > 0;
  CHECK (!stmt.Step ());

  return res;
}

void
ContractState::Initialise (const proto::Globals& data)
{
  CHECK (!IsInitialised ()) << "Contract state is already initialised";
  Store (data);
}

proto::Globals
ContractState::Load () const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `data`
      FROM `globals`
      WHERE `id` = 1
  )");

  CHECK (stmt.Step ()) << "Contract state is not initialised";

  proto::Globals res;
  CHECK (res.ParseFromString (stmt.GetBlob (0)));
  CHECK (!stmt.Step ());

  return res;
}

void
ContractState::Store (const proto::Globals& data)
{
  CHECK (mutableDb != nullptr) << "Write to read-only contract state";

  std::string serialised;
  CHECK (data.SerializeToString (&serialised));

  auto stmt = mutableDb->Prepare (R"(
    INSERT OR REPLACE INTO `globals`
      (`id`, `data`)
      VALUES (1, ?1)
  )");
  stmt.BindBlob (1, serialised);
  stmt.Execute ();
}

} // namespace mflag

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

#ifndef MFLAG_STATE_HPP
#define MFLAG_STATE_HPP

#include "proto/state.pb.h"

#include <xayagame/sqlitestorage.hpp>

namespace mflag
{

/**
 * Wrapper around the contract's global data, which is held in form of
 * a Globals proto in the database.
 */
class ContractState
{

private:

  /** The database for writes, or null if this is read-only.  */
  xaya::SQLiteDatabase* mutableDb;

  /** The database for reading.  */
  const xaya::SQLiteDatabase& db;

  /**
   * Loads the stored data.  The contract must have been deployed.
   */
  proto::Globals Load () const;

  void Store (const proto::Globals& data);

public:

  explicit ContractState (xaya::SQLiteDatabase& d)
    : mutableDb(&d), db(d)
  {}

  explicit ContractState (const xaya::SQLiteDatabase& d)
    : mutableDb(nullptr), db(d)
  {}

  ContractState () = delete;
  ContractState (const ContractState&) = delete;
  void operator= (const ContractState&) = delete;

  static void SetupSchema (xaya::SQLiteDatabase& db);

  /**
   * Returns true if the global data has been written already.
   */
  bool IsInitialised () const;

  /**
   * Writes the initial data.
   */
  void Initialise (const proto::Globals& data);

  /**
   * Exposes the data in a mutable form within the callback, and writes
   * it back afterwards.
   */
  template <typename Fcn>
    void
    AccessState (const Fcn& f)
  {
    proto::Globals data = Load ();
    f (data);
    Store (data);
  }

  /**
   * Exposes the data in a read-only form within the callback.
   */
  template <typename Fcn>
    void
    ReadState (const Fcn& f) const
  {
    const proto::Globals data = Load ();
    f (data);
  }

};

} // namespace mflag

#endif // MFLAG_STATE_HPP

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

#include "chain.hpp"

#include "errors.hpp"

#include <glog/logging.h>

namespace mflag
{

namespace
{

/**
 * Writes the ledger balance of an address.
 */
void
SetLedgerBalance (xaya::SQLiteDatabase& db, const Address& a,
                  const Amount& amount)
{
  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `balances`
      (`address`, `amount`)
      VALUES (?1, ?2)
  )");
  stmt.Bind (1, a);
  stmt.Bind (2, AmountToString (amount));
  stmt.Execute ();
}

} // anonymous namespace

Amount
GetLedgerBalance (const xaya::SQLiteDatabase& db, const Address& a)
{
  auto stmt = db.PrepareRo (R"(
    SELECT `amount`
      FROM `balances`
      WHERE `address` = ?1
  )");
  stmt.Bind (1, a);

  if (!stmt.Step ())
    return 0;

  Amount res;
  CHECK (AmountFromString (stmt.Get<std::string> (0), res))
      << "Invalid balance stored for " << a;
  CHECK (!stmt.Step ());

  return res;
}

void
Chain::SetupSchema (xaya::SQLiteDatabase& db)
{
  db.Execute (R"(
    CREATE TABLE IF NOT EXISTS `balances` (
      `address` TEXT NOT NULL PRIMARY KEY,
      `amount` TEXT NOT NULL
    )
  )");
}

void
Chain::SetCode (const Address& a, Receiver* r)
{
  if (r == nullptr)
    code.erase (a);
  else
    code[a] = r;
}

Receiver*
Chain::GetCode (const Address& a) const
{
  const auto mit = code.find (a);
  if (mit == code.end ())
    return nullptr;
  return mit->second;
}

Amount
Chain::GetBalance (const Address& a) const
{
  return GetLedgerBalance (db, a);
}

void
Chain::MoveBalance (const Address& from, const Address& to,
                    const Amount& amount)
{
  const Amount fromBalance = GetBalance (from);
  CHECK (fromBalance >= amount)
      << "Balance of " << from << " is too low for transfer of "
      << AmountToString (amount);

  SetLedgerBalance (db, from, fromBalance - amount);
  SetLedgerBalance (db, to, GetBalance (to) + amount);
}

void
Chain::Deposit (const Address& a, const Amount& amount)
{
  VLOG (1) << "Deposit of " << AmountToString (amount) << " to " << a;
  SetLedgerBalance (db, a, GetBalance (a) + amount);
}

bool
Chain::SendValue (const Address& to, const Amount& amount)
{
  if (GetBalance (self) < amount)
    {
      LOG (WARNING)
          << "Contract balance too low to send "
          << AmountToString (amount) << " to " << to;
      return false;
    }

  Frame frame(*this, self, 0);
  MoveBalance (self, to, amount);

  Receiver* r = GetCode (to);
  if (r != nullptr)
    {
      /* A failing receiver behaves like one that rejects the transfer,
         with its changes reverted by the frame.  */
      try
        {
          if (!r->OnValueReceived (self, amount))
            {
              LOG (WARNING) << "Value transfer rejected by " << to;
              return false;
            }
        }
      catch (const ContractError& exc)
        {
          LOG (WARNING)
              << "Receiver " << to << " failed on value transfer: "
              << exc.what ();
          return false;
        }
    }

  frame.Commit ();
  return true;
}

void
Chain::Emit (proto::Event&& ev)
{
  CHECK_GT (depth, 0) << "Event emitted outside of a call frame";
  VLOG (1) << "Event:\n" << ev.DebugString ();
  events.push_back (std::move (ev));
}

std::vector<proto::Event>
Chain::TakeEvents ()
{
  CHECK_EQ (depth, 0) << "Events taken while a call is in progress";
  std::vector<proto::Event> res;
  res.swap (events);
  return res;
}

Chain::Frame::Frame (Chain& c, const Address& sender, const Amount& value)
  : chain(c), numEvents(c.events.size ())
{
  if (value > 0)
    {
      const Amount available = chain.GetBalance (sender);
      if (available < value)
        throw ContractError (ErrorKind::INSUFFICIENT_FUNDS,
                             {sender, AmountToString (value),
                              AmountToString (available)});
    }

  chain.db.Execute ("SAVEPOINT `mflag_frame`");
  ++chain.depth;

  if (value > 0)
    chain.MoveBalance (sender, chain.self, value);
}

Chain::Frame::~Frame ()
{
  CHECK_GT (chain.depth, 0);
  --chain.depth;

  if (committed)
    return;

  VLOG (1) << "Reverting call frame";
  chain.db.Execute ("ROLLBACK TO `mflag_frame`");
  chain.db.Execute ("RELEASE `mflag_frame`");

  CHECK_GE (chain.events.size (), numEvents);
  chain.events.resize (numEvents);
}

void
Chain::Frame::Commit ()
{
  CHECK (!committed);
  chain.db.Execute ("RELEASE `mflag_frame`");
  committed = true;
}

} // namespace mflag

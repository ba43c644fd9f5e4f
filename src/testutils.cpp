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

#include "testutils.hpp"

#include <sqlite3.h>

#include <sstream>

namespace mflag
{

Json::Value
ParseJson (const std::string& str)
{
  std::istringstream in(str);
  Json::Value res;
  in >> res;
  return res;
}

Amount
ParseAmount (const std::string& str)
{
  Amount res;
  CHECK (AmountFromString (str, res)) << "Invalid amount: " << str;
  return res;
}

bool
ScriptedReceiver::OnTokenReceived (const Address& op, const Address& from,
                                   const TokenId id)
{
  ++tokenCalls;
  if (onToken)
    return onToken (op, from, id);
  return true;
}

bool
ScriptedReceiver::OnValueReceived (const Address& from, const Amount& amount)
{
  ++valueCalls;
  if (onValue)
    return onValue (from, amount);
  return true;
}

ContractTestBase::ContractTestBase ()
  : db("test", SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY),
    chain(db, CONTRACT),
    contract(chain)
{
  FlagContract::SetupSchema (db);
  contract.Deploy (ADMIN, BASE_URI);
  chain.TakeEvents ();
}

} // namespace mflag

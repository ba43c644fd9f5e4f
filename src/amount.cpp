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

#include "amount.hpp"

#include <limits>

namespace mflag
{

namespace
{

/**
 * Appends a decimal digit to the given number, i.e. computes
 * res = 10 * res + digit.  Returns false if that overflows.
 */
bool
AppendDigit (Amount& res, const unsigned digit)
{
  constexpr Amount max = std::numeric_limits<Amount>::max ();
  const Amount d(digit);
  if (res > (max - d) / Amount (10))
    return false;

  res = res * Amount (10) + d;
  return true;
}

} // anonymous namespace

bool
AmountFromString (const std::string& str, Amount& res)
{
  if (str.empty ())
    return false;

  res = 0;
  for (const char c : str)
    {
      if (c < '0' || c > '9')
        return false;
      if (!AppendDigit (res, c - '0'))
        return false;
    }

  return true;
}

std::string
AmountToString (const Amount& a)
{
  return intx::to_string (a);
}

std::string
IntToString (const uint64_t val)
{
  return std::to_string (val);
}

bool
AmountFromJson (const Json::Value& val, Amount& res)
{
  if (val.isString ())
    return AmountFromString (val.asString (), res);

  if (val.type () == Json::uintValue
        || (val.type () == Json::intValue && val.asInt64 () >= 0))
    {
      res = Amount (val.asUInt64 ());
      return true;
    }

  return false;
}

Json::Value
AmountToJson (const Amount& a)
{
  return AmountToString (a);
}

bool
AmountFromCoinString (const std::string& str, const unsigned decimals,
                      Amount& res)
{
  const size_t dot = str.find ('.');
  const std::string whole = str.substr (0, dot);
  std::string fraction;
  if (dot != std::string::npos)
    {
      fraction = str.substr (dot + 1);
      if (fraction.empty () || fraction.size () > decimals)
        return false;
    }

  if (whole.empty ())
    return false;

  fraction.append (decimals - fraction.size (), '0');
  return AmountFromString (whole + fraction, res);
}

} // namespace mflag

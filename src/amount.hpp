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

#ifndef MFLAG_AMOUNT_HPP
#define MFLAG_AMOUNT_HPP

#include <intx/intx.hpp>

#include <json/json.h>

#include <cstdint>
#include <string>

namespace mflag
{

/**
 * An amount of the native currency in its smallest unit.  Prices, payments
 * and balances all use this type.
 */
using Amount = intx::uint256;

/** The identifier of a flag in the registry.  */
using FlagId = intx::uint256;

/** Identifier of a minted token.  They are assigned sequentially from 1.  */
using TokenId = uint64_t;

/**
 * An address on the host chain.  The empty string is the zero address.
 */
using Address = std::string;

/**
 * Parses an unsigned decimal string into a 256-bit integer.  Returns false
 * if the string is not a valid number (empty, with any non-digit character)
 * or if it does not fit into 256 bits.
 */
bool AmountFromString (const std::string& str, Amount& res);

/**
 * Formats an amount (or flag ID) as decimal string.
 */
std::string AmountToString (const Amount& a);

/**
 * Formats a plain integer (e.g. a token ID) as decimal string.
 */
std::string IntToString (uint64_t val);

/**
 * Parses an amount from JSON.  It can either be given as decimal string
 * (for the full range) or as a non-negative JSON integer.
 */
bool AmountFromJson (const Json::Value& val, Amount& res);

/**
 * Converts an amount to JSON.  This always uses the string form, since
 * the values do not fit into JSON's integer range in general.
 */
Json::Value AmountToJson (const Amount& a);

/**
 * Parses a decimal coin string like "0.05" with the given number of
 * fractional digits of the smallest unit into an amount of that unit.
 * More fractional digits than supported are invalid.
 */
bool AmountFromCoinString (const std::string& str, unsigned decimals,
                           Amount& res);

} // namespace mflag

#endif // MFLAG_AMOUNT_HPP

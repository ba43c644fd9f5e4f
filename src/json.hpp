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

#ifndef MFLAG_JSON_HPP
#define MFLAG_JSON_HPP

#include "amount.hpp"
#include "registry.hpp"

#include <json/json.h>

#include <string>
#include <vector>

namespace mflag
{

/**
 * Converts one of the MFlag protocol buffers into a JSON form.  This is
 * implemented for the protos that are exposed through the GSP's JSON-RPC
 * interface, i.e. events and the contract globals.
 */
template <typename Proto>
  Json::Value ProtoToJson (const Proto& pb);

/**
 * Returns the string name of a category ("standard", "plus" or "premium").
 */
std::string CategoryToString (Category c);

/**
 * Parses a category from its string name (case-insensitive).  Returns false
 * if the string is not a known category.
 */
bool CategoryFromString (const std::string& str, Category& res);

/**
 * Converts a flag record to JSON.
 */
Json::Value FlagPairToJson (const FlagPair& f);

/**
 * Converts a list of token IDs to a JSON array of integers.
 */
Json::Value TokenIdsToJson (const std::vector<TokenId>& ids);

} // namespace mflag

#endif // MFLAG_JSON_HPP

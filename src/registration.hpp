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

#ifndef MFLAG_REGISTRATION_HPP
#define MFLAG_REGISTRATION_HPP

#include "amount.hpp"
#include "registry.hpp"

#include <json/json.h>

#include <string>
#include <vector>

namespace mflag
{

/** Number of decimal places of CHI (amounts are in satoshi).  */
constexpr unsigned CHI_DECIMALS = 8;

/** Maximum number of flags registered in a single batch operation.  */
constexpr unsigned REGISTRATION_BATCH_SIZE = 10;

/**
 * Per-category prices (in satoshi) used for flags that have no price
 * set in the backend listing.
 */
struct DefaultPrices
{
  Amount standard;
  Amount plus;
  Amount premium;

  /**
   * Returns the default price for a given category.
   */
  const Amount& Get (Category c) const;
};

/**
 * A flag as listed by the backend, converted to the types used for
 * registration in the contract.
 */
struct ListedFlag
{
  FlagId id;
  Category category = Category::STANDARD;
  Amount price;
  unsigned nftsRequired = 1;
  std::string metadataHash;
};

/**
 * Converts one entry of the backend's flag listing.  Unknown categories
 * are treated as standard, invalid prices are replaced by the category's
 * default and the number of tokens is clamped to the valid range, all
 * with a warning.  Returns false if the entry can not be converted
 * at all (e.g. because the ID is invalid).
 */
bool ParseListedFlag (const Json::Value& val, const DefaultPrices& defaults,
                      ListedFlag& res);

/**
 * Converts the backend's full flag listing (a JSON array).  Entries that
 * are invalid, have a zero price or repeat an earlier ID are skipped
 * with a warning.
 */
std::vector<ListedFlag> ParseFlagListing (const Json::Value& listing,
                                          const DefaultPrices& defaults);

/**
 * Removes all flags whose ID is in the given JSON array of already
 * registered IDs (as returned by the GSP's getflagids).
 */
std::vector<ListedFlag> FilterRegistered (const std::vector<ListedFlag>& flags,
                                          const Json::Value& registered);

/**
 * Builds the list of moves registering the given flags:  One batch
 * registration for each group of up to REGISTRATION_BATCH_SIZE flags,
 * followed by setting the metadata hash for each flag that has one.
 * Each batch is a separate operation, so that a batch that fails
 * does not prevent the others from being registered.
 */
Json::Value BuildRegistrationMoves (const std::vector<ListedFlag>& flags);

/**
 * Wraps a move for the game into the full value for a name_update
 * and serialises it.
 */
std::string GetNameUpdateValue (const std::string& gameId,
                                const Json::Value& mv);

} // namespace mflag

#endif // MFLAG_REGISTRATION_HPP

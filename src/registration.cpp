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

#include "registration.hpp"

#include "json.hpp"

#include <xayautil/jsonutils.hpp>

#include <glog/logging.h>

#include <algorithm>
#include <set>

namespace mflag
{

const Amount&
DefaultPrices::Get (const Category c) const
{
  switch (c)
    {
    case Category::STANDARD:
      return standard;
    case Category::PLUS:
      return plus;
    case Category::PREMIUM:
      return premium;
    default:
      LOG (FATAL) << "Invalid category: " << static_cast<int> (c);
    }
}

namespace
{

/**
 * Parses the price of a listed flag.  The backend returns it as CHI string
 * with eight decimals (e.g. "0.05000000"), but we also accept a JSON
 * number.
 */
bool
ParsePrice (const Json::Value& val, Amount& res)
{
  if (val.isString ())
    return AmountFromCoinString (val.asString (), CHI_DECIMALS, res);

  int64_t sat;
  if (!xaya::ChiAmountFromJson (val, sat) || sat < 0)
    return false;

  res = static_cast<uint64_t> (sat);
  return true;
}

} // anonymous namespace

bool
ParseListedFlag (const Json::Value& val, const DefaultPrices& defaults,
                 ListedFlag& res)
{
  if (!val.isObject ())
    return false;

  if (!AmountFromJson (val["id"], res.id))
    return false;

  const auto& category = val["category"];
  if (category.isString ())
    {
      if (!CategoryFromString (category.asString (), res.category))
        {
          LOG (WARNING)
              << "Unknown category " << category
              << " for flag " << AmountToString (res.id)
              << ", using standard";
          res.category = Category::STANDARD;
        }
    }
  else
    res.category = Category::STANDARD;

  const auto& price = val["price"];
  if (price.isNull ())
    res.price = defaults.Get (res.category);
  else if (!ParsePrice (price, res.price))
    {
      LOG (WARNING)
          << "Invalid price " << price
          << " for flag " << AmountToString (res.id)
          << ", using default";
      res.price = defaults.Get (res.category);
    }

  int64_t nfts = 1;
  const auto& nftsVal = val["nfts_required"];
  if (nftsVal.isInt64 ())
    nfts = nftsVal.asInt64 ();
  else if (!nftsVal.isNull ())
    return false;

  if (nfts < 1 || nfts > MAX_NFTS_REQUIRED)
    {
      LOG (WARNING)
          << "Clamping nfts_required " << nfts
          << " for flag " << AmountToString (res.id);
      nfts = std::max<int64_t> (1, std::min<int64_t> (nfts, MAX_NFTS_REQUIRED));
    }
  res.nftsRequired = nfts;

  const auto& hash = val["metadata_ipfs_hash"];
  if (hash.isString ())
    res.metadataHash = hash.asString ();
  else
    res.metadataHash.clear ();

  return true;
}

std::vector<ListedFlag>
ParseFlagListing (const Json::Value& listing, const DefaultPrices& defaults)
{
  std::vector<ListedFlag> res;
  if (!listing.isArray ())
    {
      LOG (WARNING) << "Flag listing is not an array";
      return res;
    }

  std::set<FlagId> seen;
  for (const auto& entry : listing)
    {
      ListedFlag cur;
      if (!ParseListedFlag (entry, defaults, cur))
        {
          LOG (WARNING) << "Skipping invalid flag entry: " << entry;
          continue;
        }
      if (cur.price == 0)
        {
          LOG (WARNING)
              << "Skipping flag " << AmountToString (cur.id)
              << " with zero price";
          continue;
        }
      if (!seen.insert (cur.id).second)
        {
          LOG (WARNING)
              << "Skipping duplicate flag " << AmountToString (cur.id);
          continue;
        }
      res.push_back (cur);
    }

  return res;
}

std::vector<ListedFlag>
FilterRegistered (const std::vector<ListedFlag>& flags,
                  const Json::Value& registered)
{
  std::set<FlagId> ids;
  if (registered.isArray ())
    {
      for (const auto& val : registered)
        {
          FlagId id;
          if (AmountFromJson (val, id))
            ids.insert (id);
          else
            LOG (WARNING) << "Ignoring invalid registered flag ID: " << val;
        }
    }
  else
    LOG (WARNING) << "Registered flag IDs are not an array: " << registered;

  std::vector<ListedFlag> res;
  for (const auto& f : flags)
    if (ids.count (f.id) == 0)
      res.push_back (f);
    else
      VLOG (1) << "Flag " << AmountToString (f.id) << " is already registered";

  return res;
}

namespace
{

/**
 * Builds a single batch registration operation for the flags in
 * the range [begin, end).
 */
Json::Value
BuildBatch (const std::vector<ListedFlag>::const_iterator begin,
            const std::vector<ListedFlag>::const_iterator end)
{
  Json::Value ids(Json::arrayValue);
  Json::Value categories(Json::arrayValue);
  Json::Value prices(Json::arrayValue);
  Json::Value nfts(Json::arrayValue);
  for (auto it = begin; it != end; ++it)
    {
      ids.append (AmountToJson (it->id));
      categories.append (static_cast<Json::Int64> (it->category));
      prices.append (AmountToJson (it->price));
      nfts.append (static_cast<Json::Int64> (it->nftsRequired));
    }

  Json::Value batch(Json::objectValue);
  batch["id"] = ids;
  batch["c"] = categories;
  batch["p"] = prices;
  batch["n"] = nfts;

  Json::Value mv(Json::objectValue);
  mv["rb"] = batch;

  return mv;
}

} // anonymous namespace

Json::Value
BuildRegistrationMoves (const std::vector<ListedFlag>& flags)
{
  Json::Value res(Json::arrayValue);

  for (auto it = flags.begin (); it != flags.end (); )
    {
      const size_t left = flags.end () - it;
      const auto end = it + std::min<size_t> (left, REGISTRATION_BATCH_SIZE);
      res.append (BuildBatch (it, end));
      it = end;
    }

  for (const auto& f : flags)
    {
      if (f.metadataHash.empty ())
        continue;

      Json::Value hash(Json::objectValue);
      hash["id"] = AmountToJson (f.id);
      hash["h"] = f.metadataHash;

      Json::Value mv(Json::objectValue);
      mv["h"] = hash;
      res.append (mv);
    }

  return res;
}

std::string
GetNameUpdateValue (const std::string& gameId, const Json::Value& mv)
{
  Json::Value g(Json::objectValue);
  g[gameId] = mv;

  Json::Value full(Json::objectValue);
  full["g"] = g;

  Json::StreamWriterBuilder wbuilder;
  wbuilder["commentStyle"] = "None";
  wbuilder["indentation"] = "";
  wbuilder["enableYAMLCompatibility"] = false;
  wbuilder["dropNullPlaceholders"] = false;
  wbuilder["useSpecialFloats"] = false;

  return Json::writeString (wbuilder, full);
}

} // namespace mflag

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

#ifndef MFLAG_PRICING_HPP
#define MFLAG_PRICING_HPP

#include "amount.hpp"
#include "registry.hpp"

#include <xayagame/sqlitestorage.hpp>

namespace mflag
{

/** Denominator for discount factors.  */
constexpr unsigned BASIS_POINTS = 10'000;

/** Discount for buyers holding premium (they pay 25%).  */
constexpr unsigned PREMIUM_DISCOUNT_BP = 7'500;

/** Discount for buyers holding plus (they pay 50%).  */
constexpr unsigned PLUS_DISCOUNT_BP = 5'000;

/**
 * Buyer tier as reported in views and DiscountGranted events.
 */
enum class Tier
{
  NONE = 0,
  PLUS = 1,
  PREMIUM = 2,
};

/**
 * The discount bits of one address.  Once set, they are never cleared.
 */
struct Discounts
{

  bool hasPlus = false;
  bool hasPremium = false;

  /**
   * Returns the effective tier, which is the highest one held.
   */
  Tier GetTier () const;

};

/**
 * Computes the effective per-token price of a flag with given category
 * and base price for a buyer with the given discounts.  Only flags of the
 * standard category are discounted.
 */
Amount DiscountedPrice (Category category, const Amount& price,
                        const Discounts& buyer);

/**
 * Database access to the per-address discount bits.
 */
class DiscountStore
{

private:

  xaya::SQLiteDatabase* mutableDb;
  const xaya::SQLiteDatabase& db;

public:

  explicit DiscountStore (xaya::SQLiteDatabase& d)
    : mutableDb(&d), db(d)
  {}

  explicit DiscountStore (const xaya::SQLiteDatabase& d)
    : mutableDb(nullptr), db(d)
  {}

  DiscountStore () = delete;
  DiscountStore (const DiscountStore&) = delete;
  void operator= (const DiscountStore&) = delete;

  static void SetupSchema (xaya::SQLiteDatabase& db);

  /**
   * Returns the discounts of an address (none for unknown ones).
   */
  Discounts Get (const Address& a) const;

  /**
   * Sets the discount bits of an address.  Bits that are set already
   * can not be cleared again.
   */
  void Set (const Address& a, const Discounts& d);

};

} // namespace mflag

#endif // MFLAG_PRICING_HPP

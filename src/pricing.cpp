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

#include "pricing.hpp"

#include <glog/logging.h>

namespace mflag
{

Tier
Discounts::GetTier () const
{
  if (hasPremium)
    return Tier::PREMIUM;
  if (hasPlus)
    return Tier::PLUS;
  return Tier::NONE;
}

namespace
{

/**
 * Computes price * bp / BASIS_POINTS (rounded down) without the
 * intermediate product overflowing.
 */
Amount
ApplyBasisPoints (const Amount& price, const unsigned bp)
{
  const Amount q = price / BASIS_POINTS;
  const Amount r = price % BASIS_POINTS;
  return q * bp + (r * bp) / BASIS_POINTS;
}

} // anonymous namespace

Amount
DiscountedPrice (const Category category, const Amount& price,
                 const Discounts& buyer)
{
  if (category != Category::STANDARD)
    return price;

  switch (buyer.GetTier ())
    {
    case Tier::PREMIUM:
      return price - ApplyBasisPoints (price, PREMIUM_DISCOUNT_BP);
    case Tier::PLUS:
      return price - ApplyBasisPoints (price, PLUS_DISCOUNT_BP);
    case Tier::NONE:
      return price;
    default:
      LOG (FATAL) << "Invalid tier";
    }
}

void
DiscountStore::SetupSchema (xaya::SQLiteDatabase& db)
{
  db.Execute (R"(
    CREATE TABLE IF NOT EXISTS `discounts` (
      `address` TEXT NOT NULL PRIMARY KEY,
      `plus` INTEGER NOT NULL,
      `premium` INTEGER NOT NULL
    )
  )");
}

Discounts
DiscountStore::Get (const Address& a) const
{
  auto stmt = db.PrepareRo (R"(
    SELECT `plus`, `premium`
      FROM `discounts`
      WHERE `address` = ?1
  )");
  stmt.Bind (1, a);

  Discounts res;
  if (!stmt.Step ())
    return res;

  res.hasPlus = (stmt.Get<int> (0) != 0);
  res.hasPremium = (stmt.Get<int> (1) != 0);
  CHECK (!stmt.Step ());

  return res;
}

void
DiscountStore::Set (const Address& a, const Discounts& d)
{
  CHECK (mutableDb != nullptr) << "Write to read-only discount store";

  const Discounts old = Get (a);
  CHECK (!old.hasPlus || d.hasPlus) << "Plus discount of " << a << " cleared";
  CHECK (!old.hasPremium || d.hasPremium)
      << "Premium discount of " << a << " cleared";

  auto stmt = mutableDb->Prepare (R"(
    INSERT OR REPLACE INTO `discounts`
      (`address`, `plus`, `premium`)
      VALUES (?1, ?2, ?3)
  )");
  stmt.Bind (1, a);
  stmt.Bind (2, d.hasPlus ? 1 : 0);
  stmt.Bind (3, d.hasPremium ? 1 : 0);
  stmt.Execute ();
}

} // namespace mflag

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

#include "testutils.hpp"

#include <gtest/gtest.h>

#include <sqlite3.h>

#include <limits>

namespace mflag
{
namespace
{

Discounts
MakeDiscounts (const bool plus, const bool premium)
{
  Discounts res;
  res.hasPlus = plus;
  res.hasPremium = premium;
  return res;
}

TEST (DiscountsTests, Tier)
{
  EXPECT_EQ (MakeDiscounts (false, false).GetTier (), Tier::NONE);
  EXPECT_EQ (MakeDiscounts (true, false).GetTier (), Tier::PLUS);
  EXPECT_EQ (MakeDiscounts (false, true).GetTier (), Tier::PREMIUM);
  EXPECT_EQ (MakeDiscounts (true, true).GetTier (), Tier::PREMIUM);
}

TEST (DiscountedPriceTests, Standard)
{
  const Amount price = ParseAmount ("10000000000000000");

  EXPECT_EQ (DiscountedPrice (Category::STANDARD, price,
                              MakeDiscounts (false, false)),
             price);
  EXPECT_EQ (DiscountedPrice (Category::STANDARD, price,
                              MakeDiscounts (true, false)),
             ParseAmount ("5000000000000000"));
  EXPECT_EQ (DiscountedPrice (Category::STANDARD, price,
                              MakeDiscounts (false, true)),
             ParseAmount ("2500000000000000"));
  EXPECT_EQ (DiscountedPrice (Category::STANDARD, price,
                              MakeDiscounts (true, true)),
             ParseAmount ("2500000000000000"));
}

TEST (DiscountedPriceTests, OtherCategoriesUndiscounted)
{
  const Amount price = 1'000;
  const auto both = MakeDiscounts (true, true);

  EXPECT_EQ (DiscountedPrice (Category::PLUS, price, both), price);
  EXPECT_EQ (DiscountedPrice (Category::PREMIUM, price, both), price);
}

TEST (DiscountedPriceTests, Rounding)
{
  /* The discount amount is rounded down, so the price paid rounds up.  */
  EXPECT_EQ (DiscountedPrice (Category::STANDARD, 3,
                              MakeDiscounts (true, false)),
             2);
  EXPECT_EQ (DiscountedPrice (Category::STANDARD, 3,
                              MakeDiscounts (false, true)),
             1);
  EXPECT_EQ (DiscountedPrice (Category::STANDARD, 1,
                              MakeDiscounts (false, true)),
             1);
  EXPECT_EQ (DiscountedPrice (Category::STANDARD, 10'001,
                              MakeDiscounts (true, false)),
             5'001);
}

TEST (DiscountedPriceTests, LargePrices)
{
  const Amount max = std::numeric_limits<Amount>::max ();

  const Amount premium
      = DiscountedPrice (Category::STANDARD, max,
                         MakeDiscounts (false, true));
  EXPECT_LT (premium, max);
  EXPECT_GT (premium, max / 4 - 1);
  EXPECT_LE (premium, max / 4 + 1);

  const Amount plus
      = DiscountedPrice (Category::STANDARD, max,
                         MakeDiscounts (true, false));
  EXPECT_GT (plus, max / 2 - 1);
  EXPECT_LE (plus, max / 2 + 1);
}

class DiscountStoreTests : public testing::Test
{

protected:

  xaya::SQLiteDatabase db;
  DiscountStore discounts;

  DiscountStoreTests ()
    : db("test", SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE
                  | SQLITE_OPEN_MEMORY),
      discounts(db)
  {
    DiscountStore::SetupSchema (db);
  }

};

TEST_F (DiscountStoreTests, DefaultIsNone)
{
  const Discounts d = discounts.Get (ALICE);
  EXPECT_FALSE (d.hasPlus);
  EXPECT_FALSE (d.hasPremium);
}

TEST_F (DiscountStoreTests, SetBits)
{
  discounts.Set (ALICE, MakeDiscounts (true, false));
  EXPECT_EQ (discounts.Get (ALICE).GetTier (), Tier::PLUS);
  EXPECT_EQ (discounts.Get (BOB).GetTier (), Tier::NONE);

  discounts.Set (ALICE, MakeDiscounts (true, true));
  const Discounts d = discounts.Get (ALICE);
  EXPECT_TRUE (d.hasPlus);
  EXPECT_TRUE (d.hasPremium);
}

TEST_F (DiscountStoreTests, ClearingIsFatal)
{
  discounts.Set (ALICE, MakeDiscounts (false, true));
  EXPECT_DEATH (discounts.Set (ALICE, MakeDiscounts (true, false)),
                "cleared");
}

} // anonymous namespace
} // namespace mflag

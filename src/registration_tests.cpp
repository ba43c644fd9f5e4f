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

#include "testutils.hpp"

#include <gtest/gtest.h>

namespace mflag
{
namespace
{

class RegistrationTests : public testing::Test
{

protected:

  DefaultPrices defaults;

  RegistrationTests ()
  {
    defaults.standard = 5'000'000;
    defaults.plus = 10'000'000;
    defaults.premium = 20'000'000;
  }

  /**
   * Parses a single listing entry given as JSON string, expecting
   * it to be valid.
   */
  ListedFlag
  Parse (const std::string& str) const
  {
    ListedFlag res;
    CHECK (ParseListedFlag (ParseJson (str), defaults, res)) << str;
    return res;
  }

};

TEST_F (RegistrationTests, DefaultPrices)
{
  EXPECT_EQ (defaults.Get (Category::STANDARD), 5'000'000);
  EXPECT_EQ (defaults.Get (Category::PLUS), 10'000'000);
  EXPECT_EQ (defaults.Get (Category::PREMIUM), 20'000'000);
}

TEST_F (RegistrationTests, FullEntry)
{
  const auto f = Parse (R"({
    "id": "123456789012345678901234567890",
    "name": "Some Town",
    "category": "Premium",
    "price": "0.05000000",
    "nfts_required": 4,
    "metadata_ipfs_hash": "QmFlag"
  })");

  EXPECT_EQ (f.id, ParseAmount ("123456789012345678901234567890"));
  EXPECT_EQ (f.category, Category::PREMIUM);
  EXPECT_EQ (f.price, 5'000'000);
  EXPECT_EQ (f.nftsRequired, 4u);
  EXPECT_EQ (f.metadataHash, "QmFlag");
}

TEST_F (RegistrationTests, Defaults)
{
  const auto f = Parse (R"({"id": 7, "category": "plus"})");
  EXPECT_EQ (f.id, 7);
  EXPECT_EQ (f.category, Category::PLUS);
  EXPECT_EQ (f.price, defaults.plus);
  EXPECT_EQ (f.nftsRequired, 1u);
  EXPECT_EQ (f.metadataHash, "");

  EXPECT_EQ (Parse (R"({"id": 8})").category, Category::STANDARD);
  EXPECT_EQ (Parse (R"({"id": 8})").price, defaults.standard);
}

TEST_F (RegistrationTests, NumericPrice)
{
  EXPECT_EQ (Parse (R"({"id": 1, "price": 0.25})").price, 25'000'000);
  EXPECT_EQ (Parse (R"({"id": 1, "price": "1"})").price, 100'000'000);
}

TEST_F (RegistrationTests, InvalidPriceUsesDefault)
{
  EXPECT_EQ (Parse (R"({"id": 1, "price": "1.123456789"})").price,
             defaults.standard);
  EXPECT_EQ (Parse (R"({"id": 1, "price": "-1"})").price, defaults.standard);
  EXPECT_EQ (Parse (R"({"id": 1, "price": -1})").price, defaults.standard);
  EXPECT_EQ (Parse (R"({"id": 1, "category": "premium", "price": true})").price,
             defaults.premium);
  EXPECT_EQ (Parse (R"({"id": 1, "category": "plus", "price": "abc"})").price,
             defaults.plus);
}

TEST_F (RegistrationTests, UnknownCategory)
{
  const auto f = Parse (R"({"id": 1, "category": "legendary"})");
  EXPECT_EQ (f.category, Category::STANDARD);
  EXPECT_EQ (f.price, defaults.standard);
}

TEST_F (RegistrationTests, ClampedNfts)
{
  EXPECT_EQ (Parse (R"({"id": 1, "nfts_required": 0})").nftsRequired, 1u);
  EXPECT_EQ (Parse (R"({"id": 1, "nfts_required": -3})").nftsRequired, 1u);
  EXPECT_EQ (Parse (R"({"id": 1, "nfts_required": 10})").nftsRequired, 10u);
  EXPECT_EQ (Parse (R"({"id": 1, "nfts_required": 50})").nftsRequired, 10u);
}

TEST_F (RegistrationTests, InvalidEntries)
{
  const auto invalid = ParseJson (R"([
    42,
    "flag",
    null,
    {},
    {"id": -1},
    {"id": "abc"},
    {"id": 1, "nfts_required": "3"}
  ])");

  for (const auto& entry : invalid)
    {
      ListedFlag dummy;
      EXPECT_FALSE (ParseListedFlag (entry, defaults, dummy)) << entry;
    }
}

TEST_F (RegistrationTests, ListingSkipsInvalid)
{
  const auto flags = ParseFlagListing (ParseJson (R"([
    {"id": 1, "category": "premium"},
    {"id": "invalid"},
    {"id": 2, "nfts_required": 3}
  ])"), defaults);

  ASSERT_EQ (flags.size (), 2u);
  EXPECT_EQ (flags[0].id, 1);
  EXPECT_EQ (flags[0].category, Category::PREMIUM);
  EXPECT_EQ (flags[1].id, 2);
  EXPECT_EQ (flags[1].nftsRequired, 3u);

  EXPECT_TRUE (ParseFlagListing (ParseJson ("{}"), defaults).empty ());
}

TEST_F (RegistrationTests, ListingSkipsZeroPrice)
{
  const auto flags = ParseFlagListing (ParseJson (R"([
    {"id": 1, "price": "0.00000000"},
    {"id": 2, "price": 0},
    {"id": 3, "price": "0.00000001"}
  ])"), defaults);

  ASSERT_EQ (flags.size (), 1u);
  EXPECT_EQ (flags[0].id, 3);
  EXPECT_EQ (flags[0].price, 1);
}

TEST_F (RegistrationTests, ListingSkipsDuplicates)
{
  const auto flags = ParseFlagListing (ParseJson (R"([
    {"id": 1, "category": "premium"},
    {"id": 2},
    {"id": "1", "category": "plus"},
    {"id": 1}
  ])"), defaults);

  ASSERT_EQ (flags.size (), 2u);
  EXPECT_EQ (flags[0].id, 1);
  EXPECT_EQ (flags[0].category, Category::PREMIUM);
  EXPECT_EQ (flags[1].id, 2);
}

TEST_F (RegistrationTests, FilterRegistered)
{
  const auto flags = ParseFlagListing (ParseJson (R"([
    {"id": 1}, {"id": 2}, {"id": 3}, {"id": 4}
  ])"), defaults);

  const auto left = FilterRegistered (flags, ParseJson (R"(["3", "1", "10"])"));
  ASSERT_EQ (left.size (), 2u);
  EXPECT_EQ (left[0].id, 2);
  EXPECT_EQ (left[1].id, 4);

  EXPECT_EQ (FilterRegistered (flags, ParseJson ("[]")).size (), 4u);
  EXPECT_EQ (FilterRegistered (flags, ParseJson ("null")).size (), 4u);
  EXPECT_EQ (FilterRegistered (flags, ParseJson (R"(["x", 2])")).size (), 3u);
}

TEST_F (RegistrationTests, BuildMoves)
{
  const auto flags = ParseFlagListing (ParseJson (R"([
    {"id": 1, "category": "premium", "metadata_ipfs_hash": "QmA"},
    {"id": "100000000000000000000", "price": "0.5", "nfts_required": 2},
    {"id": 3, "category": "plus", "metadata_ipfs_hash": "QmC"}
  ])"), defaults);

  EXPECT_EQ (BuildRegistrationMoves (flags), ParseJson (R"([
    {
      "rb":
        {
          "id": ["1", "100000000000000000000", "3"],
          "c": [2, 0, 1],
          "p": ["20000000", "50000000", "10000000"],
          "n": [1, 2, 1]
        }
    },
    {"h": {"id": "1", "h": "QmA"}},
    {"h": {"id": "3", "h": "QmC"}}
  ])"));
}

TEST_F (RegistrationTests, BuildMovesInBatches)
{
  Json::Value listing(Json::arrayValue);
  for (int i = 1; i <= 23; ++i)
    {
      Json::Value entry(Json::objectValue);
      entry["id"] = i;
      listing.append (entry);
    }

  const auto flags = ParseFlagListing (listing, defaults);
  ASSERT_EQ (flags.size (), 23u);

  const auto moves = BuildRegistrationMoves (flags);
  ASSERT_EQ (moves.size (), 3u);

  const std::vector<unsigned> sizes = {10, 10, 3};
  unsigned next = 1;
  for (unsigned i = 0; i < sizes.size (); ++i)
    {
      const auto& batch = moves[i]["rb"];
      ASSERT_TRUE (batch.isObject ()) << moves[i];
      ASSERT_EQ (batch["id"].size (), sizes[i]);
      EXPECT_EQ (batch["c"].size (), sizes[i]);
      EXPECT_EQ (batch["p"].size (), sizes[i]);
      EXPECT_EQ (batch["n"].size (), sizes[i]);
      for (const auto& id : batch["id"])
        EXPECT_EQ (id.asString (), std::to_string (next++));
    }

  EXPECT_EQ (BuildRegistrationMoves ({}), ParseJson ("[]"));
}

TEST_F (RegistrationTests, NameUpdateValue)
{
  const auto mv = ParseJson (R"({"h": {"id": "1", "h": "QmA"}})");
  EXPECT_EQ (GetNameUpdateValue ("mf", mv),
             R"({"g":{"mf":{"h":{"h":"QmA","id":"1"}}}})");
}

} // anonymous namespace
} // namespace mflag

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

#include "json.hpp"

#include "proto/events.pb.h"
#include "proto/state.pb.h"
#include "testutils.hpp"

#include <gtest/gtest.h>

namespace mflag
{
namespace
{

class JsonTests : public testing::Test
{

protected:

  /**
   * Expects that the given text proto converted to JSON equals
   * the given JSON string.
   */
  template <typename Proto>
    static void
    ExpectProtoToJson (const std::string& pb, const std::string& expectedJson)
  {
    const auto obj = ParseTextProto<Proto> (pb);
    ASSERT_EQ (ProtoToJson (obj), ParseJson (expectedJson));
  }

};

TEST_F (JsonTests, Categories)
{
  EXPECT_EQ (CategoryToString (Category::STANDARD), "standard");
  EXPECT_EQ (CategoryToString (Category::PLUS), "plus");
  EXPECT_EQ (CategoryToString (Category::PREMIUM), "premium");

  Category c;
  ASSERT_TRUE (CategoryFromString ("Premium", c));
  EXPECT_EQ (c, Category::PREMIUM);
  ASSERT_TRUE (CategoryFromString ("PLUS", c));
  EXPECT_EQ (c, Category::PLUS);
  ASSERT_TRUE (CategoryFromString ("standard", c));
  EXPECT_EQ (c, Category::STANDARD);

  EXPECT_FALSE (CategoryFromString ("", c));
  EXPECT_FALSE (CategoryFromString ("gold", c));
  EXPECT_FALSE (CategoryFromString (" plus", c));
}

TEST_F (JsonTests, RegistryEvents)
{
  ExpectProtoToJson<proto::Event> (R"(
    flag_registered:
      {
        flag_id: "123"
        category: 2
        price: "1000000"
        nfts_required: 5
      }
  )", R"({
    "type": "flag_registered",
    "flag_id": "123",
    "category": 2,
    "price": "1000000",
    "nfts_required": 5
  })");

  ExpectProtoToJson<proto::Event> (R"(
    metadata_hash_set: { flag_id: "7" metadata_hash: "QmFoo" }
  )", R"({
    "type": "metadata_hash_set",
    "flag_id": "7",
    "metadata_hash": "QmFoo"
  })");

  ExpectProtoToJson<proto::Event> (R"(
    base_uri_updated: { base_uri: "ipfs://new/" }
  )", R"({
    "type": "base_uri_updated",
    "base_uri": "ipfs://new/"
  })");
}

TEST_F (JsonTests, MintEvents)
{
  ExpectProtoToJson<proto::Event> (R"(
    first_nft_claimed:
      {
        flag_id: "1"
        token_id: 42
        claimer: "p/alice"
        ordinal: 3
      }
  )", R"({
    "type": "first_nft_claimed",
    "flag_id": "1",
    "token_id": 42,
    "claimer": "p/alice",
    "ordinal": 3
  })");

  ExpectProtoToJson<proto::Event> (R"(
    second_nft_purchased:
      {
        flag_id: "1"
        token_id: 43
        buyer: "p/bob"
        price_paid: "250"
        ordinal: 1
      }
  )", R"({
    "type": "second_nft_purchased",
    "flag_id": "1",
    "token_id": 43,
    "buyer": "p/bob",
    "price_paid": "250",
    "ordinal": 1
  })");

  ExpectProtoToJson<proto::Event> (R"(
    pair_completed: { flag_id: "1" completed_by: "p/bob" }
  )", R"({
    "type": "pair_completed",
    "flag_id": "1",
    "completed_by": "p/bob"
  })");

  ExpectProtoToJson<proto::Event> (R"(
    discount_granted: { user: "p/bob" tier: 2 }
  )", R"({
    "type": "discount_granted",
    "user": "p/bob",
    "tier": 2
  })");
}

TEST_F (JsonTests, AdminEvents)
{
  ExpectProtoToJson<proto::Event> (R"(
    withdrawal: { to: "p/admin" amount: "5000" }
  )", R"({
    "type": "withdrawal",
    "to": "p/admin",
    "amount": "5000"
  })");

  ExpectProtoToJson<proto::Event> (R"(
    ownership_transferred: { previous_owner: "" new_owner: "p/admin" }
  )", R"({
    "type": "ownership_transferred",
    "previous_owner": "",
    "new_owner": "p/admin"
  })");
}

TEST_F (JsonTests, TokenEvents)
{
  ExpectProtoToJson<proto::Event> (R"(
    transfer: { from: "" to: "p/alice" token_id: 1 }
  )", R"({
    "type": "transfer",
    "from": "",
    "to": "p/alice",
    "token_id": 1
  })");

  ExpectProtoToJson<proto::Event> (R"(
    approval: { owner: "p/alice" approved: "p/bob" token_id: 5 }
  )", R"({
    "type": "approval",
    "owner": "p/alice",
    "approved": "p/bob",
    "token_id": 5
  })");

  ExpectProtoToJson<proto::Event> (R"(
    approval_for_all: { owner: "p/alice" op: "p/bob" approved: false }
  )", R"({
    "type": "approval_for_all",
    "owner": "p/alice",
    "operator": "p/bob",
    "approved": false
  })");
}

TEST_F (JsonTests, Globals)
{
  ExpectProtoToJson<proto::Globals> (R"(
    owner: "p/admin"
    base_uri: "ipfs://flags/"
    token_counter: 12
  )", R"({
    "owner": "p/admin",
    "base_uri": "ipfs://flags/",
    "tokens_minted": 12
  })");
}

TEST_F (JsonTests, FlagPair)
{
  FlagPair f;
  f.id = ParseAmount ("100000000000000000000");
  f.category = Category::PLUS;
  f.price = 500;
  f.nftsRequired = 2;

  EXPECT_EQ (FlagPairToJson (f), ParseJson (R"({
    "id": "100000000000000000000",
    "category": "plus",
    "price": "500",
    "nfts_required": 2,
    "first_minted": false,
    "second_minted": false,
    "pair_complete": false,
    "first_minted_count": 0,
    "second_minted_count": 0,
    "first_token_id": 0,
    "second_token_id": 0
  })"));

  f.firstMinted = true;
  f.firstOwner = ALICE;
  f.firstMintedCount = 2;
  f.firstTokenId = 3;
  f.metadataHash = "QmHash";

  EXPECT_EQ (FlagPairToJson (f), ParseJson (R"({
    "id": "100000000000000000000",
    "category": "plus",
    "price": "500",
    "nfts_required": 2,
    "first_minted": true,
    "first_owner": "p/alice",
    "second_minted": false,
    "pair_complete": false,
    "first_minted_count": 2,
    "second_minted_count": 0,
    "first_token_id": 3,
    "second_token_id": 0,
    "metadata_hash": "QmHash"
  })"));
}

TEST_F (JsonTests, TokenIds)
{
  EXPECT_EQ (TokenIdsToJson ({}), ParseJson ("[]"));
  EXPECT_EQ (TokenIdsToJson ({1, 5, 2}), ParseJson ("[1, 5, 2]"));
}

} // anonymous namespace
} // namespace mflag

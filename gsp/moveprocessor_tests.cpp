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

#include "moveprocessor.hpp"

#include "params.hpp"

#include "registration.hpp"
#include "testutils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace mfg
{
namespace
{

using mflag::ADMIN;
using mflag::ALICE;
using mflag::BOB;
using mflag::CHARLIE;
using mflag::EqualsEvent;
using mflag::ParseAmount;
using mflag::ParseJson;

using testing::Contains;
using testing::ElementsAre;
using testing::IsEmpty;

class MoveProcessorTests : public mflag::ContractTestBase
{

protected:

  const Params params;

  MoveProcessorTests ()
    : params(xaya::Chain::REGTEST)
  {}

  /**
   * Builds a move notification for the given name and move (as JSON
   * string) without payment.
   */
  static Json::Value
  Move (const std::string& name, const std::string& mv)
  {
    Json::Value res(Json::objectValue);
    res["name"] = name;
    res["move"] = ParseJson (mv);
    return res;
  }

  /**
   * Builds a move notification that pays the given CHI amount to the
   * game's payment address.
   */
  Json::Value
  PaidMove (const std::string& name, const std::string& mv,
            const double chi) const
  {
    Json::Value res = Move (name, mv);
    res["out"] = Json::Value (Json::objectValue);
    res["out"][params.PaymentAddress ()] = chi;
    return res;
  }

  /**
   * Processes the given moves as one block.
   */
  void
  Process (const std::vector<Json::Value>& moves)
  {
    Json::Value arr(Json::arrayValue);
    for (const auto& mv : moves)
      arr.append (mv);

    MoveProcessor proc(chain, contract, params);
    proc.ProcessAll (arr);
  }

};

TEST_F (MoveProcessorTests, GetPayment)
{
  const std::string addr = params.PaymentAddress ();

  EXPECT_EQ (MoveProcessor::GetPayment (Move ("alice", "{}"), addr), 0);

  auto mv = Move ("alice", "{}");
  mv["out"]["other address"] = 5.0;
  EXPECT_EQ (MoveProcessor::GetPayment (mv, addr), 0);

  mv["out"][addr] = 1.5;
  EXPECT_EQ (MoveProcessor::GetPayment (mv, addr), 150'000'000);
}

TEST_F (MoveProcessorTests, Register)
{
  Process ({
    Move ("admin", R"({"r": {"id": "1", "c": 2, "p": "1000000", "n": 3}})"),
    Move ("admin", R"({"r": {"id": 2, "c": 0, "p": 500}})"),
  });

  const auto f1 = contract.GetFlagPair (1);
  EXPECT_EQ (f1.category, mflag::Category::PREMIUM);
  EXPECT_EQ (f1.price, 1'000'000);
  EXPECT_EQ (f1.nftsRequired, 3u);

  const auto f2 = contract.GetFlagPair (2);
  EXPECT_EQ (f2.category, mflag::Category::STANDARD);
  EXPECT_EQ (f2.price, 500);
  EXPECT_EQ (f2.nftsRequired, 1u);
}

TEST_F (MoveProcessorTests, BatchRegister)
{
  Process ({
    Move ("admin", R"({
      "rb":
        {
          "id": ["100000000000000000000000", 5],
          "c": [1, 0],
          "p": ["20", "10"],
          "n": [2, 4]
        }
    })"),
    Move ("admin", R"({
      "rb": {"id": ["7", "8"], "c": [0, 2], "p": ["1", "2"]}
    })"),
  });

  EXPECT_THAT (contract.GetRegisteredFlagIds (),
               ElementsAre (ParseAmount ("100000000000000000000000"),
                            5, 7, 8));
  EXPECT_EQ (contract.GetNftsRequired (5), 4u);
  EXPECT_EQ (contract.GetNftsRequired (8), 1u);
  EXPECT_EQ (contract.GetFlagPair (8).category, mflag::Category::PREMIUM);
}

TEST_F (MoveProcessorTests, FailedBatchHasNoEffect)
{
  Process ({
    Move ("admin", R"({"rb": {"id": ["1", "2"], "c": [0], "p": ["1", "2"]}})"),
    Move ("admin", R"({"rb": {"id": ["3", "4"], "c": [0, 5], "p": ["1", "2"]}})"),
  });

  EXPECT_EQ (contract.GetTotalRegisteredFlags (), 0u);
  EXPECT_THAT (TakeEvents (), IsEmpty ());
}

TEST_F (MoveProcessorTests, RegistrationRerunAddsNewFlags)
{
  mflag::DefaultPrices defaults;
  defaults.standard = 100;
  defaults.plus = 200;
  defaults.premium = 300;

  Json::Value listing(Json::arrayValue);
  for (int i = 1; i <= 12; ++i)
    {
      Json::Value entry(Json::objectValue);
      entry["id"] = i;
      listing.append (entry);
    }

  Process ({
    Move ("admin", R"({"r": {"id": "3", "c": 0, "p": "100"}})"),
  });
  ASSERT_EQ (contract.GetTotalRegisteredFlags (), 1u);

  Json::Value mv(Json::objectValue);
  mv["name"] = "admin";
  mv["move"] = mflag::BuildRegistrationMoves (
      mflag::ParseFlagListing (listing, defaults));
  ASSERT_EQ (mv["move"].size (), 2u);
  Process ({mv});

  /* The first batch contains the already registered flag 3 and fails,
     the second batch with flags 11 and 12 still goes through.  */
  EXPECT_EQ (contract.GetTotalRegisteredFlags (), 3u);
  EXPECT_FALSE (contract.IsFlagRegistered (1));
  EXPECT_TRUE (contract.IsFlagRegistered (11));
  EXPECT_TRUE (contract.IsFlagRegistered (12));
}

TEST_F (MoveProcessorTests, OnlyAdminRegisters)
{
  Process ({
    Move ("alice", R"({"r": {"id": "1", "c": 0, "p": "10"}})"),
    Move ("admin", R"({"r": {"id": "2", "c": 0, "p": "10"}})"),
  });

  EXPECT_FALSE (contract.IsFlagRegistered (1));
  EXPECT_TRUE (contract.IsFlagRegistered (2));
}

TEST_F (MoveProcessorTests, ClaimAndPurchase)
{
  Process ({
    Move ("admin", R"({"r": {"id": "1", "c": 0, "p": "1000000", "n": 2}})"),
  });
  Process ({
    Move ("alice", R"({"c": "1"})"),
    PaidMove ("bob", R"({"b": "1"})", 0.03),
  });

  const auto f = contract.GetFlagPair (1);
  EXPECT_TRUE (f.pairComplete);
  EXPECT_EQ (f.firstOwner, ALICE);
  EXPECT_EQ (f.secondOwner, BOB);
  EXPECT_EQ (contract.BalanceOf (ALICE), 2u);
  EXPECT_EQ (contract.BalanceOf (BOB), 2u);

  EXPECT_EQ (contract.GetContractBalance (), 2'000'000);
  EXPECT_EQ (chain.GetBalance (BOB), 1'000'000);
  EXPECT_EQ (contract.GetNativeBalance (BOB), 1'000'000);

  EXPECT_THAT (TakeEvents (), Contains (EqualsEvent (R"(
    pair_completed: { flag_id: "1" completed_by: "p/bob" }
  )")));
}

TEST_F (MoveProcessorTests, UnderpaidPurchaseKeepsPayment)
{
  Process ({
    Move ("admin", R"({"r": {"id": "1", "c": 1, "p": "1000000"}})"),
    Move ("alice", R"({"c": "1"})"),
  });

  Process ({PaidMove ("bob", R"({"b": "1"})", 0.004)});
  EXPECT_FALSE (contract.GetFlagPair (1).secondMinted);
  EXPECT_EQ (chain.GetBalance (BOB), 400'000);
  EXPECT_EQ (contract.GetContractBalance (), 0);

  /* The earlier payment is used together with the new one.  */
  Process ({PaidMove ("bob", R"({"b": "1"})", 0.006)});
  EXPECT_TRUE (contract.GetFlagPair (1).secondMinted);
  EXPECT_EQ (chain.GetBalance (BOB), 0);
  EXPECT_EQ (contract.GetContractBalance (), 1'000'000);
  EXPECT_TRUE (contract.UserHasPlus (BOB));
}

TEST_F (MoveProcessorTests, PaymentWithOtherOperation)
{
  Process ({PaidMove ("alice", R"({"c": "42"})", 0.5)});
  EXPECT_EQ (chain.GetBalance (ALICE), 50'000'000);
  EXPECT_EQ (contract.GetContractBalance (), 0);
}

TEST_F (MoveProcessorTests, ArrayMove)
{
  Process ({
    Move ("admin", R"([
      {"r": {"id": "1", "c": 0, "p": "10"}},
      {"r": {"id": "2", "c": 0, "p": "10"}},
      {"h": {"id": "2", "h": "QmTwo"}}
    ])"),
    Move ("alice", R"([{"c": "1"}, {"c": "3"}, {"c": "2"}])"),
  });

  EXPECT_EQ (contract.GetFlagPair (1).firstOwner, ALICE);
  EXPECT_EQ (contract.GetFlagPair (2).firstOwner, ALICE);
  EXPECT_EQ (contract.GetFlagPair (2).metadataHash, "QmTwo");
  EXPECT_EQ (contract.BalanceOf (ALICE), 2u);
}

TEST_F (MoveProcessorTests, InvalidMoves)
{
  Process ({
    Move ("admin", R"({"r": {"id": "1", "c": 0, "p": "10"}})"),
  });
  TakeEvents ();

  Json::Value noName(Json::objectValue);
  noName["move"] = ParseJson (R"({"c": "1"})");

  Process ({
    noName,
    Move ("", R"({"c": "1"})"),
    Move ("alice", R"("c")"),
    Move ("alice", R"(42)"),
    Move ("alice", R"({})"),
    Move ("alice", R"({"c": "1", "b": "1"})"),
    Move ("alice", R"({"x": "1"})"),
    Move ("alice", R"({"c": -1})"),
    Move ("alice", R"({"c": "0x01"})"),
    Move ("alice", R"({"b": [1]})"),
    Move ("admin", R"({"r": {"id": "5", "c": "0", "p": "1"}})"),
    Move ("admin", R"({"r": {"id": "5", "c": 0, "p": "1", "n": -1}})"),
    Move ("admin", R"({"r": ["5", 0, "1"]})"),
    Move ("admin", R"({"rb": {"id": "5", "c": [0], "p": ["1"]}})"),
    Move ("admin", R"({"rb": {"id": ["5"], "c": [0], "p": [-1]}})"),
    Move ("admin", R"({"h": {"id": "1", "h": 5}})"),
    Move ("admin", R"({"u": null})"),
    Move ("admin", R"({"w": []})"),
    Move ("admin", R"({"w": {"x": 1}})"),
    Move ("admin", R"({"o": ""})"),
    Move ("admin", R"({"o": 1})"),
    Move ("alice", R"({"t": {"id": "1", "to": "bob"}})"),
    Move ("alice", R"({"t": {"id": 1}})"),
  });

  EXPECT_FALSE (contract.GetFlagPair (1).firstMinted);
  EXPECT_FALSE (contract.IsFlagRegistered (5));
  EXPECT_EQ (contract.GetOwner (), ADMIN);
  EXPECT_EQ (contract.GetBaseUri (), mflag::BASE_URI);
  EXPECT_THAT (TakeEvents (), IsEmpty ());
}

TEST_F (MoveProcessorTests, AdminOperations)
{
  Process ({
    Move ("admin", R"({"r": {"id": "1", "c": 2, "p": "1000000"}})"),
    Move ("alice", R"({"c": "1"})"),
    PaidMove ("bob", R"({"b": "1"})", 0.01),
  });
  ASSERT_EQ (contract.GetContractBalance (), 1'000'000);

  Process ({
    Move ("admin", R"({"u": "ipfs://new/"})"),
    Move ("admin", R"({"h": {"id": "1", "h": "QmNew"}})"),
    Move ("admin", R"({"w": {}})"),
    Move ("admin", R"({"o": "charlie"})"),
    Move ("admin", R"({"u": "ipfs://ignored/"})"),
  });

  EXPECT_EQ (contract.GetBaseUri (), "ipfs://new/");
  EXPECT_EQ (contract.GetFlagPair (1).metadataHash, "QmNew");
  EXPECT_EQ (contract.GetContractBalance (), 0);
  EXPECT_EQ (chain.GetBalance (ADMIN), 1'000'000);
  EXPECT_EQ (contract.GetOwner (), CHARLIE);

  Process ({Move ("charlie", R"({"u": "ipfs://charlie/"})")});
  EXPECT_EQ (contract.GetBaseUri (), "ipfs://charlie/");
}

TEST_F (MoveProcessorTests, Transfer)
{
  Process ({
    Move ("admin", R"({"r": {"id": "1", "c": 0, "p": "10", "n": 2}})"),
    Move ("alice", R"({"c": "1"})"),
  });
  ASSERT_THAT (contract.GetFirstTokenIds (1), ElementsAre (1u, 2u));

  Process ({
    Move ("bob", R"({"t": {"id": 1, "to": "charlie"}})"),
    Move ("alice", R"({"t": {"id": 2, "to": "charlie"}})"),
  });

  EXPECT_EQ (contract.OwnerOf (1), ALICE);
  EXPECT_EQ (contract.OwnerOf (2), CHARLIE);
  EXPECT_EQ (contract.GetFlagPair (1).firstOwner, ALICE);
}

} // anonymous namespace
} // namespace mfg

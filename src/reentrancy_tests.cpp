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

#include "contract.hpp"

#include "testutils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

namespace mflag
{
namespace
{

using testing::ElementsAre;
using testing::IsEmpty;

class ReentrancyTests : public ContractTestBase
{

protected:

  const Amount price = 1'000;

  /** Code attached to ALICE.  */
  ScriptedReceiver alice;

  /** Errors caught by the receiver when calling back into the contract.  */
  std::vector<ErrorKind> caught;

  ReentrancyTests ()
  {
    chain.SetCode (ALICE, &alice);
    chain.Deposit (ALICE, price * 100);

    contract.RegisterFlag (ADMIN, 1, 0, price, 3);
    contract.RegisterFlag (ADMIN, 2, 1, price, 1);
    contract.RegisterFlag (ADMIN, 3, 0, price, 1);
    TakeEvents ();
  }

  /**
   * Runs the given call into the contract and records the error
   * it fails with (if any).
   */
  template <typename Fcn>
    void
    TryCall (const Fcn& f)
  {
    try
      {
        f ();
      }
    catch (const ContractError& exc)
      {
        caught.push_back (exc.GetKind ());
      }
  }

};

TEST_F (ReentrancyTests, ClaimDuringMint)
{
  alice.onToken = [this] (const Address& op, const Address& from,
                          const TokenId id)
    {
      TryCall ([this] () { contract.ClaimFirstNft (ALICE, 1); });
      TryCall ([this] () { contract.ClaimFirstNft (ALICE, 3); });
      return true;
    };

  contract.ClaimFirstNft (ALICE, 1);

  EXPECT_EQ (alice.tokenCalls, 3u);
  EXPECT_EQ (caught.size (), 6u);
  for (const auto kind : caught)
    EXPECT_EQ (kind, ErrorKind::REENTRANT_CALL);

  const FlagPair f = contract.GetFlagPair (1);
  EXPECT_TRUE (f.firstMinted);
  EXPECT_EQ (f.firstMintedCount, 3u);
  EXPECT_THAT (contract.GetFirstTokenIds (1), ElementsAre (1, 2, 3));
  EXPECT_FALSE (contract.GetFlagPair (3).firstMinted);
  EXPECT_EQ (contract.GetTotalTokensMinted (), 3u);
}

TEST_F (ReentrancyTests, PurchaseDuringMint)
{
  contract.ClaimFirstNft (BOB, 3);

  alice.onToken = [this] (const Address& op, const Address& from,
                          const TokenId id)
    {
      TryCall ([this] () { contract.PurchaseSecondNft (ALICE, 3, price); });
      return true;
    };

  contract.ClaimFirstNft (ALICE, 2);
  EXPECT_THAT (caught, ElementsAre (ErrorKind::REENTRANT_CALL));
  EXPECT_FALSE (contract.GetFlagPair (3).secondMinted);
  EXPECT_EQ (chain.GetBalance (ALICE), price * 100);
}

TEST_F (ReentrancyTests, MidStateVisibleDuringMint)
{
  std::vector<unsigned> counts;
  std::vector<bool> minted;
  alice.onToken = [&] (const Address& op, const Address& from,
                       const TokenId id)
    {
      const FlagPair f = contract.GetFlagPair (1);
      counts.push_back (f.firstMintedCount);
      minted.push_back (f.firstMinted);
      EXPECT_EQ (f.firstOwner, ALICE);
      EXPECT_EQ (contract.OwnerOf (id), ALICE);
      return true;
    };

  contract.ClaimFirstNft (ALICE, 1);
  EXPECT_THAT (counts, ElementsAre (0u, 1u, 2u));
  EXPECT_THAT (minted, ElementsAre (false, false, false));
}

TEST_F (ReentrancyTests, UnguardedTransferDuringMint)
{
  alice.onToken = [this] (const Address& op, const Address& from,
                          const TokenId id)
    {
      contract.TransferFrom (ALICE, ALICE, CHARLIE, id);
      return true;
    };

  contract.ClaimFirstNft (ALICE, 1);

  EXPECT_EQ (contract.BalanceOf (CHARLIE), 3);
  EXPECT_EQ (contract.BalanceOf (ALICE), 0);
  EXPECT_EQ (contract.GetFlagPair (1).firstOwner, ALICE);
  EXPECT_THAT (contract.GetFirstTokenIds (1), ElementsAre (1, 2, 3));
}

TEST_F (ReentrancyTests, StateDuringRefund)
{
  contract.ClaimFirstNft (BOB, 2);
  contract.ClaimFirstNft (BOB, 3);

  bool refunded = false;
  alice.onValue = [&] (const Address& from, const Amount& amount)
    {
      refunded = true;
      EXPECT_EQ (amount, price * 4);
      EXPECT_TRUE (contract.UserHasPlus (ALICE));
      EXPECT_TRUE (contract.GetFlagPair (2).pairComplete);
      TryCall ([this] () { contract.PurchaseSecondNft (ALICE, 3, price); });
      return true;
    };

  contract.PurchaseSecondNft (ALICE, 2, price * 5);

  EXPECT_TRUE (refunded);
  EXPECT_THAT (caught, ElementsAre (ErrorKind::REENTRANT_CALL));
  EXPECT_FALSE (contract.GetFlagPair (3).secondMinted);
  EXPECT_EQ (chain.GetBalance (ALICE), price * 99);
  EXPECT_EQ (contract.GetContractBalance (), price);
}

TEST_F (ReentrancyTests, RefundFailed)
{
  contract.ClaimFirstNft (BOB, 2);
  TakeEvents ();

  alice.onValue = [] (const Address& from, const Amount& amount)
    {
      return false;
    };

  ExpectContractError ([this] ()
    {
      contract.PurchaseSecondNft (ALICE, 2, price * 2);
    }, ErrorKind::REFUND_FAILED);

  const FlagPair f = contract.GetFlagPair (2);
  EXPECT_FALSE (f.secondMinted);
  EXPECT_FALSE (f.pairComplete);
  EXPECT_EQ (f.secondOwner, "");
  EXPECT_FALSE (contract.UserHasPlus (ALICE));
  EXPECT_EQ (contract.BalanceOf (ALICE), 0);
  EXPECT_EQ (chain.GetBalance (ALICE), price * 100);
  EXPECT_EQ (contract.GetContractBalance (), 0);
  EXPECT_THAT (TakeEvents (), IsEmpty ());

  /* Exact payment needs no refund and works.  */
  contract.PurchaseSecondNft (ALICE, 2, price);
  EXPECT_TRUE (contract.GetFlagPair (2).pairComplete);
  EXPECT_TRUE (contract.UserHasPlus (ALICE));
}

TEST_F (ReentrancyTests, WithdrawDuringWithdraw)
{
  ScriptedReceiver admin;
  unsigned calls = 0;
  admin.onValue = [&] (const Address& from, const Amount& amount)
    {
      ++calls;
      TryCall ([this] () { contract.Withdraw (ADMIN); });
      return true;
    };
  chain.SetCode (ADMIN, &admin);

  contract.Receive (ALICE, price);
  contract.Withdraw (ADMIN);

  EXPECT_EQ (calls, 1u);
  EXPECT_THAT (caught, ElementsAre (ErrorKind::REENTRANT_CALL));
  EXPECT_EQ (chain.GetBalance (ADMIN), price);
  EXPECT_EQ (contract.GetContractBalance (), 0);
}

TEST_F (ReentrancyTests, LockReleasedAfterFailure)
{
  alice.onToken = [] (const Address& op, const Address& from,
                      const TokenId id)
    {
      return false;
    };

  ExpectContractError ([this] ()
    {
      contract.ClaimFirstNft (ALICE, 3);
    }, ErrorKind::INVALID_RECEIVER);

  alice.onToken = nullptr;
  contract.ClaimFirstNft (ALICE, 3);
  EXPECT_TRUE (contract.GetFlagPair (3).firstMinted);
}

} // anonymous namespace
} // namespace mflag

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

#include "errors.hpp"

#include <glog/logging.h>

#include <limits>

namespace mflag
{

/**
 * RAII guard against reentrant calls of protected operations.  It fails
 * with ReentrantCall if the contract is locked already.
 */
class FlagContract::ReentrancyLock
{

private:

  FlagContract& contract;

public:

  explicit ReentrancyLock (FlagContract& c)
    : contract(c)
  {
    if (contract.locked)
      throw ContractError (ErrorKind::REENTRANT_CALL);
    contract.locked = true;
  }

  ~ReentrancyLock ()
  {
    CHECK (contract.locked);
    contract.locked = false;
  }

  ReentrancyLock () = delete;
  ReentrancyLock (const ReentrancyLock&) = delete;
  void operator= (const ReentrancyLock&) = delete;

};

FlagContract::FlagContract (Chain& c)
  : FlagViews(c.GetDatabase (), c.GetSelf ()),
    chain(c),
    flagsRw(c.GetDatabase ()), tokensRw(c.GetDatabase ()),
    discountsRw(c.GetDatabase ()), stateRw(c.GetDatabase ())
{}

void
FlagContract::SetupSchema (xaya::SQLiteDatabase& db)
{
  Chain::SetupSchema (db);
  FlagStore::SetupSchema (db);
  TokenStore::SetupSchema (db);
  DiscountStore::SetupSchema (db);
  ContractState::SetupSchema (db);
}

void
FlagContract::Deploy (const Address& deployer, const std::string& baseUri)
{
  Chain::Frame frame(chain, deployer, 0);

  proto::Globals data;
  data.set_owner (deployer);
  data.set_base_uri (baseUri);
  data.set_token_counter (0);
  stateRw.Initialise (data);

  LOG (INFO) << "Deployed contract " << self << " with admin " << deployer;

  proto::Event ev;
  auto& ot = *ev.mutable_ownership_transferred ();
  ot.set_previous_owner ("");
  ot.set_new_owner (deployer);
  chain.Emit (std::move (ev));

  frame.Commit ();
}

void
FlagContract::RequireAdmin (const Address& caller) const
{
  if (caller != GetOwner ())
    throw ContractError (ErrorKind::UNAUTHORIZED, {caller});
}

void
FlagContract::AddFlag (const FlagId& id, const unsigned category,
                       const Amount& price, const unsigned nftsRequired)
{
  if (flagsRw.IsRegistered (id))
    throw ContractError (ErrorKind::ALREADY_REGISTERED, {AmountToString (id)});

  FlagPair f;
  if (!CategoryFromInt (category, f.category))
    throw ContractError (ErrorKind::INVALID_CATEGORY, {IntToString (category)});

  if (price == 0)
    throw ContractError (ErrorKind::INVALID_PRICE);

  if (nftsRequired < 1 || nftsRequired > MAX_NFTS_REQUIRED)
    throw ContractError (ErrorKind::INVALID_NFTS_REQUIRED,
                         {IntToString (nftsRequired)});

  /* The total price of a phase must be representable.  */
  if (price > std::numeric_limits<Amount>::max () / nftsRequired)
    throw ContractError (ErrorKind::INVALID_PRICE);

  f.id = id;
  f.price = price;
  f.nftsRequired = nftsRequired;
  flagsRw.Insert (f);

  VLOG (1) << "Registered flag " << AmountToString (id);

  proto::Event ev;
  auto& reg = *ev.mutable_flag_registered ();
  reg.set_flag_id (AmountToString (id));
  reg.set_category (category);
  reg.set_price (AmountToString (price));
  reg.set_nfts_required (nftsRequired);
  chain.Emit (std::move (ev));
}

void
FlagContract::RegisterFlag (const Address& caller, const FlagId& id,
                            const unsigned category, const Amount& price,
                            const unsigned nftsRequired)
{
  Chain::Frame frame(chain, caller, 0);
  RequireAdmin (caller);
  AddFlag (id, category, price, nftsRequired);
  frame.Commit ();
}

void
FlagContract::RegisterFlagSimple (const Address& caller, const FlagId& id,
                                  const unsigned category, const Amount& price)
{
  RegisterFlag (caller, id, category, price, 1);
}

void
FlagContract::BatchRegisterFlags (const Address& caller,
                                  const std::vector<FlagId>& ids,
                                  const std::vector<unsigned>& categories,
                                  const std::vector<Amount>& prices,
                                  const std::vector<unsigned>& nftsRequired)
{
  Chain::Frame frame(chain, caller, 0);
  RequireAdmin (caller);

  if (categories.size () != ids.size () || prices.size () != ids.size ()
        || nftsRequired.size () != ids.size ())
    throw ContractError (ErrorKind::ARRAY_LENGTH_MISMATCH);

  for (size_t i = 0; i < ids.size (); ++i)
    AddFlag (ids[i], categories[i], prices[i], nftsRequired[i]);

  LOG (INFO) << "Batch-registered " << ids.size () << " flags";
  frame.Commit ();
}

void
FlagContract::BatchRegisterFlagsSimple (const Address& caller,
                                        const std::vector<FlagId>& ids,
                                        const std::vector<unsigned>& categories,
                                        const std::vector<Amount>& prices)
{
  const std::vector<unsigned> ones(ids.size (), 1);
  BatchRegisterFlags (caller, ids, categories, prices, ones);
}

void
FlagContract::SetMetadataHash (const Address& caller, const FlagId& id,
                               const std::string& hash)
{
  Chain::Frame frame(chain, caller, 0);
  RequireAdmin (caller);

  FlagPair f = RequireFlag (id);
  f.metadataHash = hash;
  flagsRw.Update (f);

  proto::Event ev;
  auto& mh = *ev.mutable_metadata_hash_set ();
  mh.set_flag_id (AmountToString (id));
  mh.set_metadata_hash (hash);
  chain.Emit (std::move (ev));

  frame.Commit ();
}

void
FlagContract::SetBaseUri (const Address& caller, const std::string& baseUri)
{
  Chain::Frame frame(chain, caller, 0);
  RequireAdmin (caller);

  stateRw.AccessState ([&baseUri] (proto::Globals& data)
    {
      data.set_base_uri (baseUri);
    });

  proto::Event ev;
  ev.mutable_base_uri_updated ()->set_base_uri (baseUri);
  chain.Emit (std::move (ev));

  frame.Commit ();
}

void
FlagContract::Withdraw (const Address& caller)
{
  Chain::Frame frame(chain, caller, 0);
  RequireAdmin (caller);
  ReentrancyLock lock(*this);

  const Amount balance = GetContractBalance ();
  if (balance == 0)
    throw ContractError (ErrorKind::NO_BALANCE_TO_WITHDRAW);

  const Address owner = GetOwner ();
  if (!chain.SendValue (owner, balance))
    throw ContractError (ErrorKind::WITHDRAWAL_FAILED);

  LOG (INFO) << "Withdrew " << AmountToString (balance) << " to " << owner;

  proto::Event ev;
  auto& w = *ev.mutable_withdrawal ();
  w.set_to (owner);
  w.set_amount (AmountToString (balance));
  chain.Emit (std::move (ev));

  frame.Commit ();
}

void
FlagContract::TransferOwnership (const Address& caller,
                                 const Address& newOwner)
{
  Chain::Frame frame(chain, caller, 0);
  RequireAdmin (caller);

  if (newOwner.empty ())
    throw ContractError (ErrorKind::INVALID_OWNER, {newOwner});

  Address previous;
  stateRw.AccessState ([&previous, &newOwner] (proto::Globals& data)
    {
      previous = data.owner ();
      data.set_owner (newOwner);
    });

  LOG (INFO) << "Admin changed from " << previous << " to " << newOwner;

  proto::Event ev;
  auto& ot = *ev.mutable_ownership_transferred ();
  ot.set_previous_owner (previous);
  ot.set_new_owner (newOwner);
  chain.Emit (std::move (ev));

  frame.Commit ();
}

void
FlagContract::CheckOnReceived (const Address& op, const Address& from,
                               const Address& to, const TokenId id)
{
  Receiver* r = chain.GetCode (to);
  if (r == nullptr)
    return;

  if (!r->OnTokenReceived (op, from, id))
    throw ContractError (ErrorKind::INVALID_RECEIVER, {to});
}

TokenId
FlagContract::SafeMint (const Address& caller, const Address& to)
{
  if (to.empty ())
    throw ContractError (ErrorKind::INVALID_RECEIVER, {to});

  TokenId id;
  stateRw.AccessState ([&id] (proto::Globals& data)
    {
      data.set_token_counter (data.token_counter () + 1);
      id = data.token_counter ();
    });

  tokensRw.Mint (id, to);

  proto::Event ev;
  auto& t = *ev.mutable_transfer ();
  t.set_from ("");
  t.set_to (to);
  t.set_token_id (id);
  chain.Emit (std::move (ev));

  CheckOnReceived (caller, "", to, id);

  return id;
}

void
FlagContract::MintPhase (const Address& caller, const FlagId& id,
                         const bool first, const Amount& pricePaid)
{
  const unsigned n = RequireFlag (id).nftsRequired;
  for (unsigned i = 0; i < n; ++i)
    {
      const TokenId tokenId = SafeMint (caller, caller);

      /* The receiver callback may have changed the record (e.g. the
         metadata hash), so we have to read it again.  */
      FlagPair f = RequireFlag (id);
      tokensRw.SetFlag (tokenId, id, first);

      proto::Event ev;
      if (first)
        {
          if (i == 0)
            f.firstTokenId = tokenId;
          ++f.firstMintedCount;

          auto& c = *ev.mutable_first_nft_claimed ();
          c.set_flag_id (AmountToString (id));
          c.set_token_id (tokenId);
          c.set_claimer (caller);
          c.set_ordinal (i + 1);
        }
      else
        {
          if (i == 0)
            f.secondTokenId = tokenId;
          ++f.secondMintedCount;

          auto& p = *ev.mutable_second_nft_purchased ();
          p.set_flag_id (AmountToString (id));
          p.set_token_id (tokenId);
          p.set_buyer (caller);
          p.set_price_paid (AmountToString (pricePaid));
          p.set_ordinal (i + 1);
        }

      flagsRw.Update (f);
      chain.Emit (std::move (ev));
    }
}

void
FlagContract::ClaimFirstNft (const Address& caller, const FlagId& id)
{
  Chain::Frame frame(chain, caller, 0);
  ReentrancyLock lock(*this);

  FlagPair f = RequireFlag (id);
  if (f.firstMinted)
    throw ContractError (ErrorKind::FIRST_ALREADY_CLAIMED,
                         {AmountToString (id)});

  f.firstOwner = caller;
  flagsRw.Update (f);

  MintPhase (caller, id, true, 0);

  f = RequireFlag (id);
  CHECK_EQ (f.firstMintedCount, f.nftsRequired);
  f.firstMinted = true;
  flagsRw.Update (f);

  LOG (INFO)
      << "First tokens of flag " << AmountToString (id)
      << " claimed by " << caller;

  frame.Commit ();
}

void
FlagContract::PurchaseSecondNft (const Address& caller, const FlagId& id,
                                 const Amount& value)
{
  Chain::Frame frame(chain, caller, value);
  ReentrancyLock lock(*this);

  FlagPair f = RequireFlag (id);
  if (!f.firstMinted)
    throw ContractError (ErrorKind::FIRST_NOT_CLAIMED, {AmountToString (id)});
  if (f.secondMinted)
    throw ContractError (ErrorKind::SECOND_ALREADY_PURCHASED,
                         {AmountToString (id)});

  Discounts buyer = discountsRw.Get (caller);
  const Amount perNft = DiscountedPrice (f.category, f.price, buyer);
  const Amount total = perNft * f.nftsRequired;
  if (value < total)
    throw ContractError (ErrorKind::INSUFFICIENT_PAYMENT,
                         {AmountToString (total), AmountToString (value)});

  f.secondOwner = caller;
  flagsRw.Update (f);

  MintPhase (caller, id, false, perNft);

  f = RequireFlag (id);
  CHECK_EQ (f.secondMintedCount, f.nftsRequired);
  f.secondMinted = true;
  f.pairComplete = true;
  flagsRw.Update (f);

  Tier granted = Tier::NONE;
  switch (f.category)
    {
    case Category::PLUS:
      if (!buyer.hasPlus)
        {
          buyer.hasPlus = true;
          granted = Tier::PLUS;
        }
      break;
    case Category::PREMIUM:
      if (!buyer.hasPremium)
        {
          buyer.hasPremium = true;
          granted = Tier::PREMIUM;
        }
      break;
    case Category::STANDARD:
      break;
    default:
      LOG (FATAL) << "Invalid category: " << static_cast<int> (f.category);
    }

  if (granted != Tier::NONE)
    {
      discountsRw.Set (caller, buyer);
      LOG (INFO)
          << "Granted discount tier " << static_cast<int> (granted)
          << " to " << caller;

      proto::Event ev;
      auto& dg = *ev.mutable_discount_granted ();
      dg.set_user (caller);
      dg.set_tier (static_cast<uint32_t> (granted));
      chain.Emit (std::move (ev));
    }

  if (value > total)
    {
      const Amount refund = value - total;
      VLOG (1) << "Refunding " << AmountToString (refund) << " to " << caller;
      if (!chain.SendValue (caller, refund))
        throw ContractError (ErrorKind::REFUND_FAILED);
    }

  LOG (INFO)
      << "Second tokens of flag " << AmountToString (id)
      << " bought by " << caller << " for " << AmountToString (total);

  proto::Event ev;
  auto& pc = *ev.mutable_pair_completed ();
  pc.set_flag_id (AmountToString (id));
  pc.set_completed_by (caller);
  chain.Emit (std::move (ev));

  frame.Commit ();
}

void
FlagContract::Receive (const Address& caller, const Amount& value)
{
  Chain::Frame frame(chain, caller, value);
  VLOG (1)
      << "Received " << AmountToString (value) << " from " << caller;
  frame.Commit ();
}

void
FlagContract::Approve (const Address& caller, const Address& to,
                       const TokenId id)
{
  Chain::Frame frame(chain, caller, 0);

  const Address owner = RequireOwner (id);
  if (caller != owner && !tokensRw.IsApprovedForAll (owner, caller))
    throw ContractError (ErrorKind::INVALID_APPROVER, {caller});

  tokensRw.SetApproved (id, to);

  proto::Event ev;
  auto& a = *ev.mutable_approval ();
  a.set_owner (owner);
  a.set_approved (to);
  a.set_token_id (id);
  chain.Emit (std::move (ev));

  frame.Commit ();
}

void
FlagContract::SetApprovalForAll (const Address& caller, const Address& op,
                                 const bool approved)
{
  Chain::Frame frame(chain, caller, 0);

  if (op.empty ())
    throw ContractError (ErrorKind::INVALID_OPERATOR, {op});

  tokensRw.SetApprovalForAll (caller, op, approved);

  proto::Event ev;
  auto& a = *ev.mutable_approval_for_all ();
  a.set_owner (caller);
  a.set_op (op);
  a.set_approved (approved);
  chain.Emit (std::move (ev));

  frame.Commit ();
}

void
FlagContract::DoTransfer (const Address& caller, const Address& from,
                          const Address& to, const TokenId id)
{
  if (to.empty ())
    throw ContractError (ErrorKind::INVALID_RECEIVER, {to});

  const Address owner = RequireOwner (id);
  if (caller != owner && !tokensRw.IsApprovedForAll (owner, caller)
        && tokensRw.GetApproved (id) != caller)
    throw ContractError (ErrorKind::INSUFFICIENT_APPROVAL,
                         {caller, IntToString (id)});

  if (owner != from)
    throw ContractError (ErrorKind::INCORRECT_OWNER,
                         {from, IntToString (id), owner});

  tokensRw.Move (id, to);

  proto::Event ev;
  auto& t = *ev.mutable_transfer ();
  t.set_from (from);
  t.set_to (to);
  t.set_token_id (id);
  chain.Emit (std::move (ev));
}

void
FlagContract::TransferFrom (const Address& caller, const Address& from,
                            const Address& to, const TokenId id)
{
  Chain::Frame frame(chain, caller, 0);
  DoTransfer (caller, from, to, id);
  frame.Commit ();
}

void
FlagContract::SafeTransferFrom (const Address& caller, const Address& from,
                                const Address& to, const TokenId id)
{
  Chain::Frame frame(chain, caller, 0);
  DoTransfer (caller, from, to, id);
  CheckOnReceived (caller, from, to, id);
  frame.Commit ();
}

} // namespace mflag

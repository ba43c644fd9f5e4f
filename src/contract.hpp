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

#ifndef MFLAG_CONTRACT_HPP
#define MFLAG_CONTRACT_HPP

#include "amount.hpp"
#include "chain.hpp"
#include "pricing.hpp"
#include "registry.hpp"
#include "state.hpp"
#include "tokens.hpp"
#include "views.hpp"

#include <string>
#include <vector>

namespace mflag
{

/**
 * The flag registry and mint engine contract.  Each of the public
 * state-changing methods is one external call into the contract:  it runs
 * in its own call frame on the Chain, and if it throws a ContractError,
 * all its effects are reverted.  The first argument is always the caller.
 */
class FlagContract : public FlagViews
{

private:

  class ReentrancyLock;

  /** The runtime we execute in.  */
  Chain& chain;

  /* Writable versions of the stores.  */
  FlagStore flagsRw;
  TokenStore tokensRw;
  DiscountStore discountsRw;
  ContractState stateRw;

  /**
   * Set while a guarded operation is in progress.  This is not part of the
   * persisted state, as it is never set in between calls.
   */
  bool locked = false;

  /**
   * Throws Unauthorized if the caller is not the admin.
   */
  void RequireAdmin (const Address& caller) const;

  /**
   * Validates a single registration tuple and adds the flag.
   */
  void AddFlag (const FlagId& id, unsigned category, const Amount& price,
                unsigned nftsRequired);

  /**
   * Runs the token-received callback of a recipient with code, and fails
   * with InvalidReceiver if it rejects the token.
   */
  void CheckOnReceived (const Address& op, const Address& from,
                        const Address& to, TokenId id);

  /**
   * Mints the next token to the given address and runs the receiver
   * callback.  Returns the new token's ID.
   */
  TokenId SafeMint (const Address& caller, const Address& to);

  /**
   * Mints the full batch of tokens for one phase of a flag.  The phase
   * flag itself is not set.
   */
  void MintPhase (const Address& caller, const FlagId& id, bool first,
                  const Amount& pricePaid);

  /**
   * Performs a transfer after checking authorisation and ownership.
   */
  void DoTransfer (const Address& caller, const Address& from,
                   const Address& to, TokenId id);

public:

  explicit FlagContract (Chain& c);

  /**
   * Sets up the database tables for the contract and the runtime.
   */
  static void SetupSchema (xaya::SQLiteDatabase& db);

  /**
   * Initialises the contract's state, making the deployer the admin.
   */
  void Deploy (const Address& deployer, const std::string& baseUri);

  /* Admin surface.  */

  void RegisterFlag (const Address& caller, const FlagId& id,
                     unsigned category, const Amount& price,
                     unsigned nftsRequired);
  void RegisterFlagSimple (const Address& caller, const FlagId& id,
                           unsigned category, const Amount& price);

  /**
   * Registers multiple flags at once.  All lists must have the same size,
   * and either all flags are registered or none.
   */
  void BatchRegisterFlags (const Address& caller,
                           const std::vector<FlagId>& ids,
                           const std::vector<unsigned>& categories,
                           const std::vector<Amount>& prices,
                           const std::vector<unsigned>& nftsRequired);
  void BatchRegisterFlagsSimple (const Address& caller,
                                 const std::vector<FlagId>& ids,
                                 const std::vector<unsigned>& categories,
                                 const std::vector<Amount>& prices);

  void SetMetadataHash (const Address& caller, const FlagId& id,
                        const std::string& hash);
  void SetBaseUri (const Address& caller, const std::string& baseUri);

  /**
   * Sends the full contract balance to the admin.
   */
  void Withdraw (const Address& caller);

  void TransferOwnership (const Address& caller, const Address& newOwner);

  /* Player surface.  */

  /**
   * Claims the first-phase tokens of a flag for free.
   */
  void ClaimFirstNft (const Address& caller, const FlagId& id);

  /**
   * Buys the second-phase tokens of a flag, paying the given value.
   * Any excess over the total price is refunded.
   */
  void PurchaseSecondNft (const Address& caller, const FlagId& id,
                          const Amount& value);

  /**
   * Plain payment into the contract.
   */
  void Receive (const Address& caller, const Amount& value);

  /* Token surface.  */

  void Approve (const Address& caller, const Address& to, TokenId id);
  void SetApprovalForAll (const Address& caller, const Address& op,
                          bool approved);
  void TransferFrom (const Address& caller, const Address& from,
                     const Address& to, TokenId id);
  void SafeTransferFrom (const Address& caller, const Address& from,
                         const Address& to, TokenId id);

};

} // namespace mflag

#endif // MFLAG_CONTRACT_HPP

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

#ifndef MFLAG_GSP_MOVEPROCESSOR_HPP
#define MFLAG_GSP_MOVEPROCESSOR_HPP

#include "params.hpp"

#include "amount.hpp"
#include "chain.hpp"
#include "contract.hpp"

#include <json/json.h>

#include <string>
#include <vector>

namespace mfg
{

/**
 * Parser for the moves of the flag game.  It extracts and validates the
 * format of the individual operations in a move, and passes them on to
 * the Process* hooks.  Whether or not an operation actually succeeds is
 * not checked here; that is up to the contract.
 */
class MoveParser
{

private:

  /**
   * Handles an individual operation (i.e. a move that is a JSON object,
   * or an element of an array move).
   */
  void HandleOperation (const mflag::Address& sender, const Json::Value& op);

  void HandleRegister (const mflag::Address& sender, const Json::Value& op);
  void HandleBatchRegister (const mflag::Address& sender,
                            const Json::Value& op);
  void HandleMetadataHash (const mflag::Address& sender,
                           const Json::Value& op);
  void HandleTransfer (const mflag::Address& sender, const Json::Value& op);

protected:

  /**
   * Called for a valid registration.  nftsRequired is null for the simple
   * form without explicit number of tokens.
   */
  virtual void
  ProcessRegister (const mflag::Address& sender, const mflag::FlagId& id,
                   unsigned category, const mflag::Amount& price,
                   const unsigned* nftsRequired)
  {}

  /**
   * Called for a valid batch registration.  nftsRequired is null for the
   * simple form.
   */
  virtual void
  ProcessBatchRegister (const mflag::Address& sender,
                        const std::vector<mflag::FlagId>& ids,
                        const std::vector<unsigned>& categories,
                        const std::vector<mflag::Amount>& prices,
                        const std::vector<unsigned>* nftsRequired)
  {}

  virtual void
  ProcessClaim (const mflag::Address& sender, const mflag::FlagId& id)
  {}

  virtual void
  ProcessPurchase (const mflag::Address& sender, const mflag::FlagId& id)
  {}

  virtual void
  ProcessMetadataHash (const mflag::Address& sender, const mflag::FlagId& id,
                       const std::string& hash)
  {}

  virtual void
  ProcessBaseUri (const mflag::Address& sender, const std::string& uri)
  {}

  virtual void
  ProcessWithdraw (const mflag::Address& sender)
  {}

  virtual void
  ProcessTransfer (const mflag::Address& sender, const mflag::Address& to,
                   mflag::TokenId id)
  {}

  virtual void
  ProcessOwnership (const mflag::Address& sender,
                    const mflag::Address& newOwner)
  {}

public:

  MoveParser () = default;
  virtual ~MoveParser () = default;

  MoveParser (const MoveParser&) = delete;
  void operator= (const MoveParser&) = delete;

  /**
   * Extracts the sender name from a move notification.  Returns false
   * if it is not there or invalid.
   */
  static bool ExtractSender (const Json::Value& obj, mflag::Address& sender);

  /**
   * Parses a single move given as JSON object as per the ZMQ
   * interface (i.e. containing both the name and actual move).
   */
  void ParseMove (const Json::Value& obj);

};

/**
 * Processor for moves in confirmed blocks, which executes them against
 * the contract.
 */
class MoveProcessor : private MoveParser
{

private:

  /** The chain the contract runs on.  */
  mflag::Chain& chain;

  /** The contract to execute operations on.  */
  mflag::FlagContract& contract;

  /** Parameters for the current chain.  */
  const Params& params;

  /**
   * Runs an operation on the contract.  If it fails, the failure is
   * logged and the operation has no effect.
   */
  template <typename Fcn>
    void Execute (const mflag::Address& sender, const std::string& what,
                  const Fcn& f);

protected:

  void ProcessRegister (const mflag::Address& sender, const mflag::FlagId& id,
                        unsigned category, const mflag::Amount& price,
                        const unsigned* nftsRequired) override;
  void ProcessBatchRegister (
      const mflag::Address& sender,
      const std::vector<mflag::FlagId>& ids,
      const std::vector<unsigned>& categories,
      const std::vector<mflag::Amount>& prices,
      const std::vector<unsigned>* nftsRequired) override;
  void ProcessClaim (const mflag::Address& sender,
                     const mflag::FlagId& id) override;
  void ProcessPurchase (const mflag::Address& sender,
                        const mflag::FlagId& id) override;
  void ProcessMetadataHash (const mflag::Address& sender,
                            const mflag::FlagId& id,
                            const std::string& hash) override;
  void ProcessBaseUri (const mflag::Address& sender,
                       const std::string& uri) override;
  void ProcessWithdraw (const mflag::Address& sender) override;
  void ProcessTransfer (const mflag::Address& sender, const mflag::Address& to,
                        mflag::TokenId id) override;
  void ProcessOwnership (const mflag::Address& sender,
                         const mflag::Address& newOwner) override;

public:

  explicit MoveProcessor (mflag::Chain& ch, mflag::FlagContract& c,
                          const Params& p)
    : chain(ch), contract(c), params(p)
  {}

  MoveProcessor () = delete;
  MoveProcessor (const MoveProcessor&) = delete;
  void operator= (const MoveProcessor&) = delete;

  /**
   * Returns the CHI amount (in satoshi) paid to the given address
   * in a move notification.
   */
  static mflag::Amount GetPayment (const Json::Value& obj,
                                   const std::string& addr);

  /**
   * Processes a single move, crediting its payment to the sender
   * first.
   */
  void ProcessOne (const Json::Value& obj);

  /**
   * Processes all moves from a given block (given as the block's
   * "moves" JSON array).
   */
  void ProcessAll (const Json::Value& moves);

};

} // namespace mfg

#endif // MFLAG_GSP_MOVEPROCESSOR_HPP

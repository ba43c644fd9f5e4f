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

#ifndef MFLAG_CHAIN_HPP
#define MFLAG_CHAIN_HPP

#include "amount.hpp"
#include "proto/events.pb.h"

#include <xayagame/sqlitestorage.hpp>

#include <map>
#include <vector>

namespace mflag
{

/**
 * Code attached to an address, which gets invoked when the address
 * receives tokens or native currency.  This is untrusted code from the
 * point of view of the contract:  it can do anything, including calling
 * back into the contract while an operation is in progress.
 */
class Receiver
{

public:

  Receiver () = default;
  virtual ~Receiver () = default;

  /**
   * Called when a token is minted or safe-transferred to the address.
   * The token is accepted if this returns true.
   */
  virtual bool OnTokenReceived (const Address& op, const Address& from,
                                TokenId id) = 0;

  /**
   * Called when native currency is sent to the address.  The transfer is
   * rejected (and reverted) if this returns false.
   */
  virtual bool OnValueReceived (const Address& from, const Amount& amount) = 0;

};

/**
 * The host runtime the contract executes in.  It provides the database
 * storage, the native-currency ledger, call frames with revert semantics,
 * dispatch to code attached to addresses and the event log.
 */
class Chain
{

private:

  /** The database holding all state.  */
  xaya::SQLiteDatabase& db;

  /** The address of the contract itself.  */
  const Address self;

  /** Code attached to addresses.  Not owned.  */
  std::map<Address, Receiver*> code;

  /** Events emitted so far (and not reverted).  */
  std::vector<proto::Event> events;

  /** Number of currently open call frames.  */
  unsigned depth = 0;

  /**
   * Moves native currency between two ledger accounts.  The source must
   * have enough balance.
   */
  void MoveBalance (const Address& from, const Address& to,
                    const Amount& amount);

public:

  class Frame;

  explicit Chain (xaya::SQLiteDatabase& d, const Address& s)
    : db(d), self(s)
  {}

  Chain () = delete;
  Chain (const Chain&) = delete;
  void operator= (const Chain&) = delete;

  /**
   * Sets up the database tables used by the runtime itself.
   */
  static void SetupSchema (xaya::SQLiteDatabase& db);

  xaya::SQLiteDatabase&
  GetDatabase ()
  {
    return db;
  }

  const xaya::SQLiteDatabase&
  GetDatabase () const
  {
    return db;
  }

  const Address&
  GetSelf () const
  {
    return self;
  }

  /**
   * Attaches code to an address.  Passing null removes it again.
   */
  void SetCode (const Address& a, Receiver* r);

  /**
   * Returns the code attached to an address, or null if there is none.
   */
  Receiver* GetCode (const Address& a) const;

  /**
   * Returns the native balance of an address.
   */
  Amount GetBalance (const Address& a) const;

  /**
   * Credits native currency coming from outside the chain (e.g. a payment
   * made with a move) to the given address.
   */
  void Deposit (const Address& a, const Amount& amount);

  /**
   * Sends native currency from the contract to the given address.  If the
   * recipient has code that rejects the transfer, everything done by it
   * is reverted and false is returned.
   */
  bool SendValue (const Address& to, const Amount& amount);

  /**
   * Adds an event to the log.  Must be called within a call frame.
   */
  void Emit (proto::Event&& ev);

  const std::vector<proto::Event>&
  GetEvents () const
  {
    return events;
  }

  /**
   * Returns and clears all events logged so far.
   */
  std::vector<proto::Event> TakeEvents ();

};

/**
 * A call into the contract.  Constructing it opens a database savepoint
 * and moves the attached value from the sender to the contract.  Unless
 * it is committed, destructing it reverts all changes made inside the
 * frame (including nested frames) and drops its events.
 */
class Chain::Frame
{

private:

  /** The chain this is for.  */
  Chain& chain;

  /** Size of the event log when the frame was opened.  */
  const size_t numEvents;

  /** Set to true when the frame has been committed.  */
  bool committed = false;

public:

  /**
   * Opens the frame.  Throws InsufficientFunds if the sender cannot
   * pay the value.
   */
  explicit Frame (Chain& c, const Address& sender, const Amount& value);

  ~Frame ();

  Frame () = delete;
  Frame (const Frame&) = delete;
  void operator= (const Frame&) = delete;

  /**
   * Keeps all changes made within the frame.
   */
  void Commit ();

};

/**
 * Reads the native balance of an address directly from a database.
 */
Amount GetLedgerBalance (const xaya::SQLiteDatabase& db, const Address& a);

} // namespace mflag

#endif // MFLAG_CHAIN_HPP

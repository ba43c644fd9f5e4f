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

#ifndef MFLAG_TESTUTILS_HPP
#define MFLAG_TESTUTILS_HPP

#include "amount.hpp"
#include "chain.hpp"
#include "contract.hpp"
#include "errors.hpp"
#include "proto/events.pb.h"

#include <xayagame/sqlitestorage.hpp>

#include <json/json.h>

#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <google/protobuf/text_format.h>
#include <google/protobuf/util/message_differencer.h>

#include <functional>
#include <string>
#include <vector>

namespace mflag
{

/** Address of the contract in tests.  */
constexpr const char* CONTRACT = "g/mf";

/* Some addresses used in tests.  */
constexpr const char* ADMIN = "p/admin";
constexpr const char* ALICE = "p/alice";
constexpr const char* BOB = "p/bob";
constexpr const char* CHARLIE = "p/charlie";

/** Base URI the contract is deployed with in tests.  */
constexpr const char* BASE_URI = "ipfs://flags/";

/**
 * Parses a string to JSON.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Parses a decimal string to an Amount, which must be valid.
 */
Amount ParseAmount (const std::string& str);

/**
 * Parses a protocol buffer from text format.
 */
template <typename Proto>
  Proto
  ParseTextProto (const std::string& str)
{
  Proto res;
  CHECK (google::protobuf::TextFormat::ParseFromString (str, &res));
  return res;
}

#define DEFINE_PROTO_MATCHER(name, type) \
  MATCHER_P (name, str, "") \
  { \
    const auto expected = ParseTextProto<proto::type> (str);\
    if (google::protobuf::util::MessageDifferencer::Equals (arg, expected)) \
      return true; \
    *result_listener << "actual: " << arg.DebugString (); \
    return false; \
  }

DEFINE_PROTO_MATCHER (EqualsEvent, Event)

/**
 * Expects that the given callable throws a ContractError of
 * the given kind.
 */
template <typename Fcn>
  void
  ExpectContractError (const Fcn& f, const ErrorKind kind)
{
  try
    {
      f ();
      ADD_FAILURE () << "Expected error " << ErrorKindToString (kind);
    }
  catch (const ContractError& exc)
    {
      EXPECT_EQ (exc.GetKind (), kind) << exc.what ();
    }
}

/**
 * Receiver for tests whose behaviour is given by callbacks.  If no
 * callback is set, it accepts everything.  It counts how often it has
 * been invoked.
 */
class ScriptedReceiver : public Receiver
{

public:

  using TokenCallback
      = std::function<bool (const Address& op, const Address& from,
                            TokenId id)>;
  using ValueCallback
      = std::function<bool (const Address& from, const Amount& amount)>;

  TokenCallback onToken;
  ValueCallback onValue;

  unsigned tokenCalls = 0;
  unsigned valueCalls = 0;

  ScriptedReceiver () = default;

  bool OnTokenReceived (const Address& op, const Address& from,
                        TokenId id) override;
  bool OnValueReceived (const Address& from, const Amount& amount) override;

};

/**
 * Test fixture with an in-memory database, the chain runtime and
 * a contract deployed by ADMIN.
 */
class ContractTestBase : public testing::Test
{

protected:

  xaya::SQLiteDatabase db;
  Chain chain;
  FlagContract contract;

  ContractTestBase ();

  /**
   * Returns the events emitted since the last call (or construction) and
   * clears them.
   */
  std::vector<proto::Event>
  TakeEvents ()
  {
    return chain.TakeEvents ();
  }

};

} // namespace mflag

#endif // MFLAG_TESTUTILS_HPP

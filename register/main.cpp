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

#include "rpc-stubs/gsprpcclient.h"
#include "rpc-stubs/xayarpcclient.h"

#include "amount.hpp"
#include "registration.hpp"

#include <jsonrpccpp/client/connectors/httpclient.h>

#include <json/json.h>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace
{

DEFINE_string (flags_file, "",
               "JSON file with the flag listing exported from the backend");

DEFINE_string (xaya_rpc_url, "",
               "URL at which Xaya's JSON-RPC interface is available;"
               " if empty, the name_update value is just printed");
DEFINE_string (gsp_rpc_url, "",
               "URL of the flag GSP's JSON-RPC interface; if set, flags"
               " that are already registered are skipped");
DEFINE_string (admin_name, "",
               "Xaya name (without p/) of the contract admin");
DEFINE_string (game_id, "mf", "game ID of the flag GSP");

DEFINE_string (default_price_standard, "0.01",
               "price in CHI for standard flags without explicit price");
DEFINE_string (default_price_plus, "0.02",
               "price in CHI for plus flags without explicit price");
DEFINE_string (default_price_premium, "0.05",
               "price in CHI for premium flags without explicit price");

/**
 * Exception thrown for usage errors (won't be logged).
 */
class UsageError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * Parses a CHI amount given on the command line.
 */
mflag::Amount
ParseChiFlag (const std::string& name, const std::string& value)
{
  mflag::Amount res;
  if (!mflag::AmountFromCoinString (value, mflag::CHI_DECIMALS, res))
    throw UsageError ("invalid amount for --" + name + ": " + value);
  return res;
}

/**
 * Reads the flag listing from the given file.
 */
Json::Value
ReadListing (const std::string& file)
{
  std::ifstream in(file);
  if (!in)
    throw UsageError ("could not open " + file);

  Json::Value res;
  in >> res;

  return res;
}

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);

  gflags::SetUsageMessage ("Register municipal flags with the contract");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  try
    {
      if (FLAGS_flags_file.empty ())
        throw UsageError ("--flags_file must be set");
      if (!FLAGS_xaya_rpc_url.empty () && FLAGS_admin_name.empty ())
        throw UsageError ("--admin_name must be set to send the move");

      mflag::DefaultPrices defaults;
      defaults.standard = ParseChiFlag ("default_price_standard",
                                        FLAGS_default_price_standard);
      defaults.plus = ParseChiFlag ("default_price_plus",
                                    FLAGS_default_price_plus);
      defaults.premium = ParseChiFlag ("default_price_premium",
                                       FLAGS_default_price_premium);

      auto flags = mflag::ParseFlagListing (ReadListing (FLAGS_flags_file),
                                            defaults);

      if (!FLAGS_gsp_rpc_url.empty ())
        {
          jsonrpc::HttpClient httpGsp(FLAGS_gsp_rpc_url);
          GspRpcClient gsp(httpGsp);

          const Json::Value registered = gsp.getflagids ();
          const size_t before = flags.size ();
          flags = mflag::FilterRegistered (flags, registered["data"]);
          LOG (INFO)
              << "Skipping " << (before - flags.size ())
              << " already registered flags";
        }

      if (flags.empty ())
        {
          LOG (WARNING) << "No flags to register";
          return EXIT_SUCCESS;
        }
      LOG (INFO) << "Registering " << flags.size () << " flags";

      const auto mv = mflag::BuildRegistrationMoves (flags);
      const std::string value
          = mflag::GetNameUpdateValue (FLAGS_game_id, mv);

      if (FLAGS_xaya_rpc_url.empty ())
        {
          std::cout << value << std::endl;
          return EXIT_SUCCESS;
        }

      jsonrpc::HttpClient httpXaya(FLAGS_xaya_rpc_url);
      XayaRpcClient xaya(httpXaya);

      const std::string txid
          = xaya.name_update ("p/" + FLAGS_admin_name, value);
      LOG (INFO) << "Sent registration move: " << txid;
      std::cout << txid << std::endl;

      return EXIT_SUCCESS;
    }
  catch (const UsageError& exc)
    {
      std::cerr << "Error: " << exc.what () << std::endl;
      return EXIT_FAILURE;
    }
  catch (const std::exception& exc)
    {
      LOG (ERROR) << exc.what ();
      std::cerr << "Error: " << exc.what () << std::endl;
      return EXIT_FAILURE;
    }
}

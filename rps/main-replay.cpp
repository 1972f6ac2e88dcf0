// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.h"

#include "game.hpp"
#include "operators.hpp"
#include "replay.hpp"

#include "wagergame/custody.hpp"
#include "wagergame/sqlitestorage.hpp"
#include "wagergame/storage.hpp"
#include "wagerutil/amount.hpp"
#include "wagerutil/jsonutils.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <google/protobuf/stubs/common.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace
{

DEFINE_string (calls, "",
               "JSON file with the array of calls to replay");

DEFINE_string (storage_file, "",
               "if set, store the game state in this SQLite database"
               " instead of just in memory");

DEFINE_string (operators, "",
               "comma-separated list of identities that are operators");

DEFINE_string (reject_transfers, "",
               "comma-separated list of identities to which all transfers"
               " fail");

/**
 * Reads the full content of a file.  Returns false if it cannot be opened.
 */
bool
ReadFile (const std::string& path, std::string& content)
{
  std::ifstream in(path);
  if (!in)
    return false;

  std::ostringstream buf;
  buf << in.rdbuf ();
  content = buf.str ();

  return true;
}

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  gflags::SetUsageMessage ("Replay calls against a rock-paper-scissors game");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  if (FLAGS_calls.empty ())
    {
      std::cerr << "Error: --calls must be set" << std::endl;
      return EXIT_FAILURE;
    }

  std::string content;
  if (!ReadFile (FLAGS_calls, content))
    {
      std::cerr << "Error: could not read " << FLAGS_calls << std::endl;
      return EXIT_FAILURE;
    }

  Json::Value calls;
  if (!wager::ParseJson (content, calls) || !calls.isArray ())
    {
      std::cerr << "Error: " << FLAGS_calls << " is not a JSON array"
                << std::endl;
      return EXIT_FAILURE;
    }

  std::unique_ptr<wager::StorageInterface> storage;
  if (FLAGS_storage_file.empty ())
    storage = std::make_unique<wager::MemoryStorage> ();
  else
    storage = std::make_unique<wager::SQLiteStorage> (FLAGS_storage_file);
  storage->Initialise ();

  wager::MemoryCustody custody;
  for (const auto& name : rps::ParseNameList (FLAGS_reject_transfers))
    custody.SetRejecting (name, true);

  const auto operatorNames = rps::ParseNameList (FLAGS_operators);
  LOG_IF (WARNING, operatorNames.empty ())
      << "No operators configured, the game cannot be initialised";
  const rps::StaticOperators operators(operatorNames);

  rps::RpsGame game(*storage, custody, operators);
  rps::CallReplayer replayer(game);

  Json::Value transfers(Json::objectValue);
  Json::Value output(Json::objectValue);
  output["results"] = replayer.ProcessAll (calls);
  output["state"] = game.GetStateAsJson ();
  output["escrow"] = wager::AmountToJson (game.GetEscrowTotal ());
  for (const auto& entry : custody.GetAllReceived ())
    transfers[entry.first] = wager::AmountToJson (entry.second);
  output["transfers"] = transfers;

  std::cout << output << std::endl;

  return EXIT_SUCCESS;
}

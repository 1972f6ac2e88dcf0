// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPS_TESTUTILS_HPP
#define RPS_TESTUTILS_HPP

#include "choice.hpp"
#include "game.hpp"
#include "operators.hpp"
#include "status.hpp"

#include "proto/rps.pb.h"
#include "wagergame/context.hpp"
#include "wagergame/custody.hpp"
#include "wagergame/storage.hpp"
#include "wagerutil/amount.hpp"
#include "wagerutil/uint256.hpp"

#include <gtest/gtest.h>

#include <json/json.h>

#include <cstdint>
#include <string>

namespace rps
{

/** The operator identity used in tests.  */
extern const std::string OPERATOR;

/**
 * Returns a deterministic blinding factor derived from a seed string.
 */
wager::uint256 TestBlinding (const std::string& seed);

/**
 * Parses a JSON string, expecting it to be valid.
 */
Json::Value ParseTestJson (const std::string& str);

/**
 * Test fixture with a game on in-memory storage and custody.
 */
class GameTestFixture : public testing::Test
{

protected:

  wager::MemoryStorage storage;
  wager::MemoryCustody custody;
  StaticOperators operators;

  RpsGame game;

  GameTestFixture ();

  /**
   * Constructs a call context.
   */
  static wager::CallContext Ctx (const std::string& caller,
                                 uint64_t height = 0,
                                 const wager::Amount& value = 0);

  /**
   * Initialises the game with the given parameters, expecting success.
   */
  void InitGame (const wager::Amount& bet, const wager::Amount& deposit,
                 const wager::Amount& revealWindow);

  /**
   * Commits to the given choice for a player.  The blinding factor is
   * derived from the player name.
   */
  Status CommitChoice (const std::string& name, Choice c,
                       const wager::Amount& value, uint64_t height = 0);

  /**
   * Reveals the choice of a player, using the same blinding factor
   * as CommitChoice.
   */
  Status RevealChoice (const std::string& name, Choice c, uint64_t height = 0);

  /**
   * Returns the current state proto.
   */
  proto::GameState
  GetState () const
  {
    return game.GetState ();
  }

  /**
   * Returns the serialised current state, for byte-wise comparisons.
   */
  std::string GetRawState () const;

};

} // namespace rps

#endif // RPS_TESTUTILS_HPP

// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPS_REPLAY_HPP
#define RPS_REPLAY_HPP

#include "game.hpp"

#include <json/json.h>

namespace rps
{

/**
 * Runs a sequence of calls given as JSON against a game.  Each call is
 * an object of the form
 *
 *  {"op": "commit", "caller": "alice", "height": 10, "value": "110", ...}
 *
 * with further fields for the arguments of the operation.  "height" and
 * "value" are optional and default to zero.
 */
class CallReplayer
{

private:

  /** The game the calls are made on.  */
  RpsGame& game;

public:

  explicit CallReplayer (RpsGame& g)
    : game(g)
  {}

  CallReplayer () = delete;
  CallReplayer (const CallReplayer&) = delete;
  void operator= (const CallReplayer&) = delete;

  /**
   * Processes a single call and returns the result as JSON object
   * with (at least) a "status" field.  If the call is malformed, the
   * status is "malformed" and nothing is done.
   */
  Json::Value ProcessCall (const Json::Value& call);

  /**
   * Processes all calls in the given JSON array in order and returns
   * the array of results.
   */
  Json::Value ProcessAll (const Json::Value& calls);

};

} // namespace rps

#endif // RPS_REPLAY_HPP

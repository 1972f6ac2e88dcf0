// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPS_STATEJSON_HPP
#define RPS_STATEJSON_HPP

#include "proto/rps.pb.h"

#include <json/json.h>

namespace rps
{

/**
 * Converts the full game state to the JSON format used for queries and
 * the replay tool's output.  Amounts are decimal strings, the commitments
 * are hex.
 */
Json::Value GameStateToJson (const proto::GameState& state);

} // namespace rps

#endif // RPS_STATEJSON_HPP

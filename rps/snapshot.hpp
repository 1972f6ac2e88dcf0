// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPS_SNAPSHOT_HPP
#define RPS_SNAPSHOT_HPP

#include "proto/rps.pb.h"

#include <string>

namespace rps
{

/**
 * Encodes a full game state as opaque snapshot string (base64 of the
 * serialised protocol buffer).
 */
std::string EncodeSnapshot (const proto::GameState& state);

/**
 * Decodes a snapshot string and validates the resulting state.  Returns
 * false if the snapshot is malformed or the state is not consistent.
 */
bool DecodeSnapshot (const std::string& snapshot, proto::GameState& state);

} // namespace rps

#endif // RPS_SNAPSHOT_HPP

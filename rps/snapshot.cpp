// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "snapshot.hpp"

#include "gamestate.hpp"

#include "wagerutil/protoutils.hpp"

#include <glog/logging.h>

namespace rps
{

std::string
EncodeSnapshot (const proto::GameState& state)
{
  return wager::ProtoToBase64 (state);
}

bool
DecodeSnapshot (const std::string& snapshot, proto::GameState& state)
{
  proto::GameState decoded;
  if (!wager::ProtoFromBase64 (snapshot, decoded))
    return false;

  if (!ValidateState (decoded))
    {
      LOG (WARNING) << "Snapshot contains invalid state";
      return false;
    }

  state = std::move (decoded);
  return true;
}

} // namespace rps

// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "commitment.hpp"

#include "wagerutil/hash.hpp"

#include <glog/logging.h>

#include <cstdint>

namespace rps
{

wager::uint256
ComputeCommitment (const Choice c, const wager::uint256& blinding,
                   const std::string& committer)
{
  CHECK (c != Choice::NONE);

  wager::SHA256 hasher;
  hasher << static_cast<uint8_t> (ChoiceToInteger (c)) << blinding
         << committer;

  return hasher.Finalise ();
}

bool
VerifyCommitment (const wager::uint256& commitment, const Choice c,
                  const wager::uint256& blinding,
                  const std::string& committer)
{
  const wager::uint256 actual = ComputeCommitment (c, blinding, committer);
  if (actual != commitment)
    {
      LOG (WARNING)
          << "Commitment mismatch for " << committer
          << ": expected " << commitment.ToHex ()
          << ", revealed data hashes to " << actual.ToHex ();
      return false;
    }

  return true;
}

} // namespace rps

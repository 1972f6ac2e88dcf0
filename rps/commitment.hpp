// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPS_COMMITMENT_HPP
#define RPS_COMMITMENT_HPP

#include "choice.hpp"

#include "wagerutil/uint256.hpp"

#include <string>

namespace rps
{

/**
 * Computes the commitment hash for a given choice.  It is the SHA-256 of
 * the choice byte, followed by the 32 bytes of the blinding factor and
 * then the name of the committer.  Binding the committer's name prevents
 * another player from copying a commitment.
 */
wager::uint256 ComputeCommitment (Choice c, const wager::uint256& blinding,
                                  const std::string& committer);

/**
 * Checks whether the given choice and blinding factor open the commitment
 * made by the given committer.  The choice must not be NONE.
 */
bool VerifyCommitment (const wager::uint256& commitment, Choice c,
                       const wager::uint256& blinding,
                       const std::string& committer);

} // namespace rps

#endif // RPS_COMMITMENT_HPP

// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPS_STATUS_HPP
#define RPS_STATUS_HPP

#include <ostream>
#include <string>

namespace rps
{

/**
 * Result of an operation on the game.  Everything except OK is a
 * failure, in which case the operation has not changed anything.
 */
enum class Status
{
  OK,

  INVALID_STAGE,
  LOCKED,
  DUPLICATE_PLAYER,
  INSUFFICIENT_FUNDS,
  UNKNOWN_PLAYER,
  INVALID_CHOICE,
  INVALID_COMMITMENT,
  TRANSFER_FAILED,
  DISTRIBUTE_FAILED,
  INVALID_SNAPSHOT,

  NOT_INITIALISED,
  ALREADY_INITIALISED,
  INVALID_PARAMETERS,
  UNAUTHORISED,
  NOT_LOCKED,
  NOT_PAYABLE,
  ALREADY_REVEALED,
  DEADLINE_NOT_PASSED,
};

/**
 * Returns the stable string name of a status, e.g. "invalid-stage".
 */
std::string StatusToString (Status s);

std::ostream& operator<< (std::ostream& out, Status s);

} // namespace rps

#endif // RPS_STATUS_HPP

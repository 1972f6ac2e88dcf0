// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "status.hpp"

#include <glog/logging.h>

namespace rps
{

std::string
StatusToString (const Status s)
{
  switch (s)
    {
    case Status::OK:
      return "ok";
    case Status::INVALID_STAGE:
      return "invalid-stage";
    case Status::LOCKED:
      return "locked";
    case Status::DUPLICATE_PLAYER:
      return "duplicate-player";
    case Status::INSUFFICIENT_FUNDS:
      return "insufficient-funds";
    case Status::UNKNOWN_PLAYER:
      return "unknown-player";
    case Status::INVALID_CHOICE:
      return "invalid-choice";
    case Status::INVALID_COMMITMENT:
      return "invalid-commitment";
    case Status::TRANSFER_FAILED:
      return "transfer-failed";
    case Status::DISTRIBUTE_FAILED:
      return "distribute-failed";
    case Status::INVALID_SNAPSHOT:
      return "invalid-snapshot";
    case Status::NOT_INITIALISED:
      return "not-initialised";
    case Status::ALREADY_INITIALISED:
      return "already-initialised";
    case Status::INVALID_PARAMETERS:
      return "invalid-parameters";
    case Status::UNAUTHORISED:
      return "unauthorised";
    case Status::NOT_LOCKED:
      return "not-locked";
    case Status::NOT_PAYABLE:
      return "not-payable";
    case Status::ALREADY_REVEALED:
      return "already-revealed";
    case Status::DEADLINE_NOT_PASSED:
      return "deadline-not-passed";
    }

  LOG (FATAL) << "Invalid status: " << static_cast<int> (s);
}

std::ostream&
operator<< (std::ostream& out, const Status s)
{
  return out << StatusToString (s);
}

} // namespace rps

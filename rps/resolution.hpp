// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPS_RESOLUTION_HPP
#define RPS_RESOLUTION_HPP

#include "choice.hpp"

#include "wagerutil/amount.hpp"

#include <ostream>

namespace rps
{

/**
 * The outcome of a round based on the two revealed choices.
 */
enum class Outcome
{
  DRAW,
  FIRST_WINS,
  SECOND_WINS,
  /** Neither player revealed.  */
  INVALID,
};

/**
 * Determines the outcome of a round.  A choice of NONE means that player
 * did not reveal and thus loses by forfeit against any revealed choice.
 */
Outcome Resolve (Choice first, Choice second);

std::ostream& operator<< (std::ostream& out, Outcome o);

/**
 * How the pool of a round is split between the two slots.  For each slot,
 * the payout is transferred out right away, while the retained amount is
 * credited to the player's ledger balance (from where it can be withdrawn).
 * The four amounts always add up to the full pool of 2 * (bet + deposit).
 */
struct Settlement
{

  Outcome outcome;

  /** Whether a player won because the other did not reveal.  */
  bool forfeit;

  wager::Amount payout[2];
  wager::Amount retained[2];

};

/**
 * Computes the settlement of a round with the given choices and game
 * parameters.
 */
Settlement Settle (Choice first, Choice second,
                   const wager::Amount& bet, const wager::Amount& deposit);

} // namespace rps

#endif // RPS_RESOLUTION_HPP

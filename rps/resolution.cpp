// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "resolution.hpp"

#include <glog/logging.h>

namespace rps
{

Outcome
Resolve (const Choice first, const Choice second)
{
  if (first == Choice::NONE && second == Choice::NONE)
    return Outcome::INVALID;
  if (first == Choice::NONE)
    return Outcome::SECOND_WINS;
  if (second == Choice::NONE)
    return Outcome::FIRST_WINS;

  if (first == second)
    return Outcome::DRAW;

  return Beats (first, second) ? Outcome::FIRST_WINS : Outcome::SECOND_WINS;
}

std::ostream&
operator<< (std::ostream& out, const Outcome o)
{
  switch (o)
    {
    case Outcome::DRAW:
      return out << "draw";
    case Outcome::FIRST_WINS:
      return out << "first wins";
    case Outcome::SECOND_WINS:
      return out << "second wins";
    case Outcome::INVALID:
      return out << "invalid";
    }

  LOG (FATAL) << "Invalid outcome: " << static_cast<int> (o);
}

Settlement
Settle (const Choice first, const Choice second,
        const wager::Amount& bet, const wager::Amount& deposit)
{
  Settlement res;
  res.outcome = Resolve (first, second);
  res.forfeit = (first == Choice::NONE) != (second == Choice::NONE);

  switch (res.outcome)
    {
    case Outcome::DRAW:
      for (unsigned i = 0; i < 2; ++i)
        {
          res.payout[i] = bet + deposit;
          res.retained[i] = 0;
        }
      break;

    case Outcome::INVALID:
      /* Nobody revealed.  The deposits are paid out, while the bets stay
         credited to their owners in the ledger.  */
      for (unsigned i = 0; i < 2; ++i)
        {
          res.payout[i] = deposit;
          res.retained[i] = bet;
        }
      break;

    case Outcome::FIRST_WINS:
    case Outcome::SECOND_WINS:
      {
        const unsigned winner = (res.outcome == Outcome::FIRST_WINS ? 0 : 1);
        const unsigned loser = 1 - winner;

        res.payout[winner] = 2 * bet + deposit;
        res.payout[loser] = 0;

        /* The loser's deposit is returned to them if they played fairly,
           and goes to the winner on a forfeit.  */
        if (res.forfeit)
          {
            res.retained[winner] = deposit;
            res.retained[loser] = 0;
          }
        else
          {
            res.retained[winner] = 0;
            res.retained[loser] = deposit;
          }
        break;
      }
    }

  VLOG (1)
      << "Settlement for " << first << " vs " << second
      << ": " << res.outcome
      << ", payouts " << res.payout[0] << " / " << res.payout[1]
      << ", retained " << res.retained[0] << " / " << res.retained[1];

  return res;
}

} // namespace rps

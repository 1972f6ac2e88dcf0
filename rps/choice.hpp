// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPS_CHOICE_HPP
#define RPS_CHOICE_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace rps
{

/**
 * The choice a player makes.  NONE is used for a choice that has
 * not been revealed.
 */
enum class Choice
{
  NONE = 0,
  ROCK = 1,
  PAPER = 2,
  SCISSORS = 3,
};

/**
 * Converts an integer (e.g. as revealed by a player or stored in a
 * snapshot) to a choice.  Only the values of ROCK, PAPER and SCISSORS are
 * accepted; for everything else, false is returned.
 */
bool ChoiceFromInteger (uint64_t val, Choice& c);

/**
 * Returns the integer value of a choice, which is also used as its
 * byte in commitments.
 */
uint32_t ChoiceToInteger (Choice c);

/**
 * Returns a string name of the choice, e.g. "rock".
 */
std::string ChoiceToString (Choice c);

/**
 * Returns true if a beats b.  Both must be proper choices (not NONE).
 */
bool Beats (Choice a, Choice b);

std::ostream& operator<< (std::ostream& out, Choice c);

} // namespace rps

#endif // RPS_CHOICE_HPP

// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "choice.hpp"

#include <glog/logging.h>

namespace rps
{

bool
ChoiceFromInteger (const uint64_t val, Choice& c)
{
  switch (val)
    {
    case 1:
      c = Choice::ROCK;
      return true;
    case 2:
      c = Choice::PAPER;
      return true;
    case 3:
      c = Choice::SCISSORS;
      return true;
    default:
      VLOG (1) << "Invalid choice value: " << val;
      return false;
    }
}

uint32_t
ChoiceToInteger (const Choice c)
{
  return static_cast<uint32_t> (c);
}

std::string
ChoiceToString (const Choice c)
{
  switch (c)
    {
    case Choice::NONE:
      return "none";
    case Choice::ROCK:
      return "rock";
    case Choice::PAPER:
      return "paper";
    case Choice::SCISSORS:
      return "scissors";
    }

  LOG (FATAL) << "Invalid choice: " << static_cast<int> (c);
}

bool
Beats (const Choice a, const Choice b)
{
  CHECK (a != Choice::NONE && b != Choice::NONE);

  switch (a)
    {
    case Choice::ROCK:
      return b == Choice::SCISSORS;
    case Choice::PAPER:
      return b == Choice::ROCK;
    case Choice::SCISSORS:
      return b == Choice::PAPER;
    default:
      LOG (FATAL) << "Unexpected choice: " << static_cast<int> (a);
    }
}

std::ostream&
operator<< (std::ostream& out, const Choice c)
{
  return out << ChoiceToString (c);
}

} // namespace rps

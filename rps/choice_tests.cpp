// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "choice.hpp"

#include "status.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <set>

namespace rps
{
namespace
{

TEST (ChoiceTests, FromInteger)
{
  Choice c;

  ASSERT_TRUE (ChoiceFromInteger (1, c));
  EXPECT_EQ (c, Choice::ROCK);
  ASSERT_TRUE (ChoiceFromInteger (2, c));
  EXPECT_EQ (c, Choice::PAPER);
  ASSERT_TRUE (ChoiceFromInteger (3, c));
  EXPECT_EQ (c, Choice::SCISSORS);

  c = Choice::ROCK;
  EXPECT_FALSE (ChoiceFromInteger (0, c));
  EXPECT_FALSE (ChoiceFromInteger (4, c));
  EXPECT_FALSE (ChoiceFromInteger (256 + 1, c));
  EXPECT_FALSE (ChoiceFromInteger (std::numeric_limits<uint64_t>::max (), c));
  EXPECT_EQ (c, Choice::ROCK);
}

TEST (ChoiceTests, ToIntegerAndString)
{
  EXPECT_EQ (ChoiceToInteger (Choice::NONE), 0);
  EXPECT_EQ (ChoiceToInteger (Choice::ROCK), 1);
  EXPECT_EQ (ChoiceToInteger (Choice::PAPER), 2);
  EXPECT_EQ (ChoiceToInteger (Choice::SCISSORS), 3);

  EXPECT_EQ (ChoiceToString (Choice::NONE), "none");
  EXPECT_EQ (ChoiceToString (Choice::SCISSORS), "scissors");
}

TEST (ChoiceTests, Beats)
{
  EXPECT_TRUE (Beats (Choice::ROCK, Choice::SCISSORS));
  EXPECT_TRUE (Beats (Choice::SCISSORS, Choice::PAPER));
  EXPECT_TRUE (Beats (Choice::PAPER, Choice::ROCK));

  EXPECT_FALSE (Beats (Choice::SCISSORS, Choice::ROCK));
  EXPECT_FALSE (Beats (Choice::PAPER, Choice::SCISSORS));
  EXPECT_FALSE (Beats (Choice::ROCK, Choice::PAPER));

  EXPECT_FALSE (Beats (Choice::ROCK, Choice::ROCK));
}

TEST (StatusTests, NamesAreUnique)
{
  const Status all[] = {
    Status::OK,
    Status::INVALID_STAGE, Status::LOCKED, Status::DUPLICATE_PLAYER,
    Status::INSUFFICIENT_FUNDS, Status::UNKNOWN_PLAYER, Status::INVALID_CHOICE,
    Status::INVALID_COMMITMENT, Status::TRANSFER_FAILED,
    Status::DISTRIBUTE_FAILED, Status::INVALID_SNAPSHOT,
    Status::NOT_INITIALISED, Status::ALREADY_INITIALISED,
    Status::INVALID_PARAMETERS, Status::UNAUTHORISED, Status::NOT_LOCKED,
    Status::NOT_PAYABLE, Status::ALREADY_REVEALED,
    Status::DEADLINE_NOT_PASSED,
  };

  std::set<std::string> names;
  for (const auto s : all)
    EXPECT_TRUE (names.insert (StatusToString (s)).second) << s;

  EXPECT_EQ (StatusToString (Status::OK), "ok");
  EXPECT_EQ (StatusToString (Status::DEADLINE_NOT_PASSED),
             "deadline-not-passed");
}

} // anonymous namespace
} // namespace rps

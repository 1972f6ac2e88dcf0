// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "testutils.hpp"

#include "commitment.hpp"

#include "wagerutil/hash.hpp"
#include "wagerutil/jsonutils.hpp"

namespace rps
{

const std::string OPERATOR = "admin";

wager::uint256
TestBlinding (const std::string& seed)
{
  return wager::SHA256::Hash ("blinding " + seed);
}

Json::Value
ParseTestJson (const std::string& str)
{
  Json::Value res;
  EXPECT_TRUE (wager::ParseJson (str, res)) << str;
  return res;
}

GameTestFixture::GameTestFixture ()
  : operators({OPERATOR}), game(storage, custody, operators)
{}

wager::CallContext
GameTestFixture::Ctx (const std::string& caller, const uint64_t height,
                      const wager::Amount& value)
{
  return wager::CallContext (caller, value, height);
}

void
GameTestFixture::InitGame (const wager::Amount& bet,
                           const wager::Amount& deposit,
                           const wager::Amount& revealWindow)
{
  ASSERT_EQ (game.Initialise (Ctx (OPERATOR), bet, deposit, revealWindow),
             Status::OK);
}

Status
GameTestFixture::CommitChoice (const std::string& name, const Choice c,
                               const wager::Amount& value,
                               const uint64_t height)
{
  const auto commitment = ComputeCommitment (c, TestBlinding (name), name);
  return game.Commit (Ctx (name, height, value), commitment);
}

Status
GameTestFixture::RevealChoice (const std::string& name, const Choice c,
                               const uint64_t height)
{
  return game.Reveal (Ctx (name, height), ChoiceToInteger (c),
                      TestBlinding (name));
}

std::string
GameTestFixture::GetRawState () const
{
  if (!storage.HasCurrentState ())
    return "";
  return storage.GetCurrentState ();
}

} // namespace rps

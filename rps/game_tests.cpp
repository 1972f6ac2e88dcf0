// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "game.hpp"

#include "commitment.hpp"
#include "gamestate.hpp"
#include "snapshot.hpp"
#include "testutils.hpp"

#include "wagergame/sqlitestorage.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

namespace rps
{
namespace
{

using wager::Amount;

/**
 * Basic game fixture with bet 100, deposit 10 and reveal window 5.
 */
class RpsGameTests : public GameTestFixture
{

protected:

  RpsGameTests ()
  {
    InitGame (100, 10, 5);
  }

  /**
   * Returns the total value that is accounted for, i.e. the sum of all
   * ledger balances and everything paid out so far.
   */
  Amount
  TotalAccounted () const
  {
    return custody.GetTotalDelivered () + game.GetEscrowTotal ();
  }

  /**
   * Plays a round up to the distribute stage with both players revealing.
   */
  void
  PlayUntilDistribute (const Choice a, const Choice b)
  {
    ASSERT_EQ (CommitChoice ("alice", a, 110), Status::OK);
    ASSERT_EQ (CommitChoice ("bob", b, 110), Status::OK);
    ASSERT_EQ (RevealChoice ("alice", a, 10), Status::OK);
    ASSERT_EQ (RevealChoice ("bob", b, 12), Status::OK);
    ASSERT_EQ (GetStage (GetState ()), Stage::DISTRIBUTE);
  }

};

/* ************************************************************************** */

using InitialisationTests = GameTestFixture;

TEST_F (InitialisationTests, NotInitialised)
{
  std::string snapshot;
  EXPECT_EQ (game.Lock (Ctx (OPERATOR)), Status::NOT_INITIALISED);
  EXPECT_EQ (game.Unlock (Ctx (OPERATOR)), Status::NOT_INITIALISED);
  EXPECT_EQ (game.ExportState (Ctx (OPERATOR), snapshot),
             Status::NOT_INITIALISED);
  EXPECT_EQ (game.ImportState (Ctx (OPERATOR), snapshot),
             Status::NOT_INITIALISED);
  EXPECT_EQ (CommitChoice ("alice", Choice::ROCK, 110),
             Status::NOT_INITIALISED);
  EXPECT_EQ (RevealChoice ("alice", Choice::ROCK), Status::NOT_INITIALISED);
  EXPECT_EQ (game.ForceForfeit (Ctx ("alice")), Status::NOT_INITIALISED);
  EXPECT_EQ (game.Distribute (Ctx ("alice")), Status::NOT_INITIALISED);
  EXPECT_EQ (game.Withdraw (Ctx ("alice")), Status::NOT_INITIALISED);

  EXPECT_FALSE (storage.HasCurrentState ());
  EXPECT_EQ (game.GetStateAsJson ()["initialised"].asBool (), false);
}

TEST_F (InitialisationTests, Success)
{
  ASSERT_EQ (game.Initialise (Ctx (OPERATOR), 100, 10, 5), Status::OK);

  const auto state = GetState ();
  ASSERT_TRUE (IsInitialised (state));
  EXPECT_EQ (GetStage (state), Stage::FIRST_COMMIT);
  EXPECT_FALSE (state.locked ());
  EXPECT_EQ (GetRevealDeadline (state), 0);
  EXPECT_EQ (GetParameters (state).GetStake (), 110);
}

TEST_F (InitialisationTests, OnlyOnce)
{
  ASSERT_EQ (game.Initialise (Ctx (OPERATOR), 100, 10, 5), Status::OK);
  EXPECT_EQ (game.Initialise (Ctx (OPERATOR), 1, 1, 1),
             Status::ALREADY_INITIALISED);
  EXPECT_EQ (GetParameters (GetState ()).GetBet (), 100);
}

TEST_F (InitialisationTests, OnlyOperator)
{
  EXPECT_EQ (game.Initialise (Ctx ("alice"), 100, 10, 5),
             Status::UNAUTHORISED);
  EXPECT_FALSE (storage.HasCurrentState ());
}

TEST_F (InitialisationTests, NotPayable)
{
  EXPECT_EQ (game.Initialise (Ctx (OPERATOR, 0, 1), 100, 10, 5),
             Status::NOT_PAYABLE);
}

TEST_F (InitialisationTests, PoolOverflow)
{
  const Amount halfMax = wager::MaxAmount () / 2;
  EXPECT_EQ (game.Initialise (Ctx (OPERATOR), halfMax, 1, 5),
             Status::INVALID_PARAMETERS);
  EXPECT_EQ (game.Initialise (Ctx (OPERATOR), halfMax - 1, 1, 5), Status::OK);
}

TEST_F (InitialisationTests, DeadlineSaturates)
{
  InitGame (100, 10, wager::MaxAmount ());

  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
  ASSERT_EQ (CommitChoice ("bob", Choice::PAPER, 110), Status::OK);
  ASSERT_EQ (RevealChoice ("alice", Choice::ROCK, 100), Status::OK);

  EXPECT_EQ (GetRevealDeadline (GetState ()), wager::MaxAmount ());
  const uint64_t maxHeight = std::numeric_limits<uint64_t>::max ();
  EXPECT_EQ (game.ForceForfeit (Ctx ("alice", maxHeight)),
             Status::DEADLINE_NOT_PASSED);
}

/* ************************************************************************** */

TEST_F (RpsGameTests, LockAndUnlockAreIdempotent)
{
  ASSERT_EQ (game.Lock (Ctx (OPERATOR)), Status::OK);
  ASSERT_EQ (game.Lock (Ctx (OPERATOR)), Status::OK);
  EXPECT_TRUE (GetState ().locked ());

  ASSERT_EQ (game.Unlock (Ctx (OPERATOR)), Status::OK);
  ASSERT_EQ (game.Unlock (Ctx (OPERATOR)), Status::OK);
  EXPECT_FALSE (GetState ().locked ());
}

TEST_F (RpsGameTests, LockOnlyOperator)
{
  EXPECT_EQ (game.Lock (Ctx ("alice")), Status::UNAUTHORISED);
  EXPECT_FALSE (GetState ().locked ());

  ASSERT_EQ (game.Lock (Ctx (OPERATOR)), Status::OK);
  EXPECT_EQ (game.Unlock (Ctx ("alice")), Status::UNAUTHORISED);
  EXPECT_TRUE (GetState ().locked ());
}

TEST_F (RpsGameTests, LockedBlocksMutations)
{
  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
  ASSERT_EQ (game.Lock (Ctx (OPERATOR)), Status::OK);

  const std::string before = GetRawState ();
  EXPECT_EQ (CommitChoice ("bob", Choice::ROCK, 110), Status::LOCKED);
  EXPECT_EQ (RevealChoice ("alice", Choice::ROCK), Status::LOCKED);
  EXPECT_EQ (game.ForceForfeit (Ctx ("bob")), Status::LOCKED);
  EXPECT_EQ (game.Distribute (Ctx ("bob")), Status::LOCKED);
  EXPECT_EQ (game.Withdraw (Ctx ("alice")), Status::LOCKED);
  EXPECT_EQ (GetRawState (), before);

  ASSERT_EQ (game.Unlock (Ctx (OPERATOR)), Status::OK);
  EXPECT_EQ (CommitChoice ("bob", Choice::ROCK, 110), Status::OK);
}

TEST_F (RpsGameTests, NotPayable)
{
  const std::string before = GetRawState ();
  EXPECT_EQ (game.Lock (Ctx (OPERATOR, 0, 5)), Status::NOT_PAYABLE);
  EXPECT_EQ (game.Distribute (Ctx ("alice", 0, 5)), Status::NOT_PAYABLE);
  EXPECT_EQ (game.Withdraw (Ctx ("alice", 0, 5)), Status::NOT_PAYABLE);
  EXPECT_EQ (game.Reveal (Ctx ("alice", 0, 5), 1, TestBlinding ("alice")),
             Status::NOT_PAYABLE);
  EXPECT_EQ (GetRawState (), before);
}

/* ************************************************************************** */

TEST_F (RpsGameTests, TwoCommitsEscrowPool)
{
  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
  EXPECT_EQ (GetStage (GetState ()), Stage::SECOND_COMMIT);

  ASSERT_EQ (CommitChoice ("bob", Choice::PAPER, 110), Status::OK);
  const auto state = GetState ();
  EXPECT_EQ (GetStage (state), Stage::FIRST_REVEAL);
  ASSERT_EQ (state.slots_size (), 2);
  EXPECT_EQ (state.slots (0).name (), "alice");
  EXPECT_EQ (state.slots (1).name (), "bob");
  EXPECT_EQ (GetChoice (state.slots (0)), Choice::NONE);

  EXPECT_EQ (game.GetBalance ("alice"), 110);
  EXPECT_EQ (game.GetBalance ("bob"), 110);
  EXPECT_EQ (game.GetEscrowTotal (), 220);
  EXPECT_EQ (TotalAccounted (), 220);
  EXPECT_EQ (custody.GetTotalDelivered (), 0);
}

TEST_F (RpsGameTests, CommitExcessIsRefunded)
{
  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 150), Status::OK);
  EXPECT_EQ (custody.GetReceived ("alice"), 40);
  EXPECT_EQ (game.GetBalance ("alice"), 110);
}

TEST_F (RpsGameTests, CommitRefundRejected)
{
  custody.SetRejecting ("alice", true);

  const std::string before = GetRawState ();
  EXPECT_EQ (CommitChoice ("alice", Choice::ROCK, 150),
             Status::TRANSFER_FAILED);
  EXPECT_EQ (GetRawState (), before);

  /* Without excess, no transfer is needed.  */
  EXPECT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
}

TEST_F (RpsGameTests, CommitInsufficientFunds)
{
  EXPECT_EQ (CommitChoice ("alice", Choice::ROCK, 109),
             Status::INSUFFICIENT_FUNDS);
  EXPECT_EQ (CommitChoice ("alice", Choice::ROCK, 0),
             Status::INSUFFICIENT_FUNDS);
  EXPECT_EQ (GetStage (GetState ()), Stage::FIRST_COMMIT);
}

TEST_F (RpsGameTests, CommitDuplicatePlayer)
{
  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
  EXPECT_EQ (CommitChoice ("alice", Choice::PAPER, 110),
             Status::DUPLICATE_PLAYER);
  EXPECT_EQ (GetStage (GetState ()), Stage::SECOND_COMMIT);
  EXPECT_EQ (game.GetBalance ("alice"), 110);
}

TEST_F (RpsGameTests, CommitEmptyCaller)
{
  EXPECT_EQ (CommitChoice ("", Choice::ROCK, 110), Status::UNKNOWN_PLAYER);
  EXPECT_EQ (GetStage (GetState ()), Stage::FIRST_COMMIT);
  EXPECT_EQ (GetState ().slots_size (), 0);
  EXPECT_EQ (TotalAccounted (), 0);
}

TEST_F (RpsGameTests, CommitWrongStage)
{
  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
  ASSERT_EQ (CommitChoice ("bob", Choice::ROCK, 110), Status::OK);
  EXPECT_EQ (CommitChoice ("charly", Choice::ROCK, 110),
             Status::INVALID_STAGE);
}

/* ************************************************************************** */

TEST_F (RpsGameTests, RevealBeforeCommitsDone)
{
  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
  EXPECT_EQ (RevealChoice ("alice", Choice::ROCK), Status::INVALID_STAGE);
}

TEST_F (RpsGameTests, RevealInvalidChoice)
{
  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
  ASSERT_EQ (CommitChoice ("bob", Choice::ROCK, 110), Status::OK);

  for (const uint64_t c : {uint64_t (0), uint64_t (4), uint64_t (1) << 40})
    EXPECT_EQ (game.Reveal (Ctx ("alice"), c, TestBlinding ("alice")),
               Status::INVALID_CHOICE);
}

TEST_F (RpsGameTests, RevealUnknownPlayer)
{
  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
  ASSERT_EQ (CommitChoice ("bob", Choice::ROCK, 110), Status::OK);
  EXPECT_EQ (RevealChoice ("charly", Choice::ROCK), Status::UNKNOWN_PLAYER);
}

TEST_F (RpsGameTests, RevealMismatch)
{
  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
  ASSERT_EQ (CommitChoice ("bob", Choice::ROCK, 110), Status::OK);

  EXPECT_EQ (RevealChoice ("alice", Choice::PAPER),
             Status::INVALID_COMMITMENT);
  EXPECT_EQ (game.Reveal (Ctx ("alice"), 1, TestBlinding ("bob")),
             Status::INVALID_COMMITMENT);

  const auto state = GetState ();
  EXPECT_EQ (GetChoice (state.slots (0)), Choice::NONE);
  EXPECT_EQ (GetStage (state), Stage::FIRST_REVEAL);
}

TEST_F (RpsGameTests, RevealArmsDeadline)
{
  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
  ASSERT_EQ (CommitChoice ("bob", Choice::PAPER, 110), Status::OK);

  ASSERT_EQ (RevealChoice ("bob", Choice::PAPER, 100), Status::OK);
  auto state = GetState ();
  EXPECT_EQ (GetStage (state), Stage::SECOND_REVEAL);
  EXPECT_EQ (GetRevealDeadline (state), 105);
  EXPECT_EQ (GetChoice (state.slots (1)), Choice::PAPER);

  EXPECT_EQ (RevealChoice ("bob", Choice::PAPER, 101),
             Status::ALREADY_REVEALED);

  ASSERT_EQ (RevealChoice ("alice", Choice::ROCK, 105), Status::OK);
  state = GetState ();
  EXPECT_EQ (GetStage (state), Stage::DISTRIBUTE);
  EXPECT_EQ (GetRevealDeadline (state), 105);
}

TEST_F (RpsGameTests, SecondRevealTooLate)
{
  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
  ASSERT_EQ (CommitChoice ("bob", Choice::PAPER, 110), Status::OK);
  ASSERT_EQ (RevealChoice ("alice", Choice::ROCK, 100), Status::OK);

  EXPECT_EQ (RevealChoice ("bob", Choice::PAPER, 106), Status::INVALID_STAGE);
  EXPECT_EQ (GetChoice (GetState ().slots (1)), Choice::NONE);
}

/* ************************************************************************** */

TEST_F (RpsGameTests, ForceForfeit)
{
  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
  ASSERT_EQ (CommitChoice ("bob", Choice::PAPER, 110), Status::OK);
  EXPECT_EQ (game.ForceForfeit (Ctx ("alice", 200)), Status::INVALID_STAGE);

  ASSERT_EQ (RevealChoice ("alice", Choice::ROCK, 100), Status::OK);
  EXPECT_EQ (game.ForceForfeit (Ctx ("alice", 100)),
             Status::DEADLINE_NOT_PASSED);
  EXPECT_EQ (game.ForceForfeit (Ctx ("alice", 105)),
             Status::DEADLINE_NOT_PASSED);

  ASSERT_EQ (game.ForceForfeit (Ctx ("charly", 106)), Status::OK);
  const auto state = GetState ();
  EXPECT_EQ (GetStage (state), Stage::DISTRIBUTE);
  EXPECT_EQ (GetChoice (state.slots (1)), Choice::NONE);

  EXPECT_EQ (game.ForceForfeit (Ctx ("alice", 200)), Status::INVALID_STAGE);
}

/* ************************************************************************** */

TEST_F (RpsGameTests, DistributeWrongStage)
{
  EXPECT_EQ (game.Distribute (Ctx ("alice")), Status::INVALID_STAGE);
  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
  EXPECT_EQ (game.Distribute (Ctx ("alice")), Status::INVALID_STAGE);
}

TEST_F (RpsGameTests, RockBeatsScissors)
{
  PlayUntilDistribute (Choice::ROCK, Choice::SCISSORS);
  ASSERT_EQ (game.Distribute (Ctx ("charly")), Status::OK);

  EXPECT_EQ (custody.GetReceived ("alice"), 210);
  EXPECT_EQ (custody.GetReceived ("bob"), 0);
  EXPECT_EQ (custody.GetReceived ("charly"), 0);

  EXPECT_EQ (game.GetBalance ("alice"), 0);
  EXPECT_EQ (game.GetBalance ("bob"), 10);
  EXPECT_EQ (TotalAccounted (), 220);

  const auto state = GetState ();
  EXPECT_EQ (GetStage (state), Stage::FIRST_COMMIT);
  EXPECT_EQ (state.slots_size (), 0);
  EXPECT_EQ (GetRevealDeadline (state), 0);
  EXPECT_FALSE (state.has_reveal_deadline ());
}

TEST_F (RpsGameTests, SecondPlayerWins)
{
  PlayUntilDistribute (Choice::ROCK, Choice::PAPER);
  ASSERT_EQ (game.Distribute (Ctx ("alice")), Status::OK);

  EXPECT_EQ (custody.GetReceived ("alice"), 0);
  EXPECT_EQ (custody.GetReceived ("bob"), 210);
  EXPECT_EQ (game.GetBalance ("alice"), 10);
}

TEST_F (RpsGameTests, Draw)
{
  PlayUntilDistribute (Choice::SCISSORS, Choice::SCISSORS);
  ASSERT_EQ (game.Distribute (Ctx ("alice")), Status::OK);

  EXPECT_EQ (custody.GetReceived ("alice"), 110);
  EXPECT_EQ (custody.GetReceived ("bob"), 110);
  EXPECT_EQ (game.GetBalance ("alice"), 0);
  EXPECT_EQ (game.GetBalance ("bob"), 0);
}

TEST_F (RpsGameTests, ForfeitScenario)
{
  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
  ASSERT_EQ (CommitChoice ("bob", Choice::PAPER, 110), Status::OK);
  ASSERT_EQ (RevealChoice ("alice", Choice::ROCK, 10), Status::OK);

  ASSERT_EQ (game.ForceForfeit (Ctx ("alice", 16)), Status::OK);
  ASSERT_EQ (game.Distribute (Ctx ("alice", 16)), Status::OK);

  EXPECT_EQ (custody.GetReceived ("alice"), 210);
  EXPECT_EQ (custody.GetReceived ("bob"), 0);
  EXPECT_EQ (game.GetBalance ("bob"), 0);
  EXPECT_EQ (game.GetBalance ("alice"), 10);
  EXPECT_EQ (TotalAccounted (), 220);
}

TEST_F (RpsGameTests, DistributeFailureIsAtomic)
{
  PlayUntilDistribute (Choice::PAPER, Choice::PAPER);
  custody.SetRejecting ("bob", true);

  const std::string before = GetRawState ();
  EXPECT_EQ (game.Distribute (Ctx ("alice")), Status::DISTRIBUTE_FAILED);
  EXPECT_EQ (GetRawState (), before);
  EXPECT_EQ (custody.GetTotalDelivered (), 0);

  custody.SetRejecting ("bob", false);
  ASSERT_EQ (game.Distribute (Ctx ("alice")), Status::OK);
  EXPECT_EQ (custody.GetReceived ("alice"), 110);
  EXPECT_EQ (custody.GetReceived ("bob"), 110);
}

TEST_F (RpsGameTests, MultipleRounds)
{
  PlayUntilDistribute (Choice::ROCK, Choice::SCISSORS);
  ASSERT_EQ (game.Distribute (Ctx ("alice")), Status::OK);

  /* Bob still has his deposit of 10 from the first round in the ledger.  */
  ASSERT_EQ (CommitChoice ("bob", Choice::PAPER, 110), Status::OK);
  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
  ASSERT_EQ (RevealChoice ("bob", Choice::PAPER, 50), Status::OK);
  ASSERT_EQ (RevealChoice ("alice", Choice::ROCK, 51), Status::OK);
  ASSERT_EQ (game.Distribute (Ctx ("alice")), Status::OK);

  EXPECT_EQ (custody.GetReceived ("alice"), 210);
  EXPECT_EQ (custody.GetReceived ("bob"), 210);
  EXPECT_EQ (game.GetBalance ("alice"), 10);
  EXPECT_EQ (game.GetBalance ("bob"), 10);
  EXPECT_EQ (TotalAccounted (), 440);
}

/* ************************************************************************** */

TEST_F (RpsGameTests, WithdrawRetainedBalance)
{
  PlayUntilDistribute (Choice::ROCK, Choice::SCISSORS);
  ASSERT_EQ (game.Distribute (Ctx ("alice")), Status::OK);

  EXPECT_EQ (game.Withdraw (Ctx ("alice")), Status::INSUFFICIENT_FUNDS);

  ASSERT_EQ (game.Withdraw (Ctx ("bob")), Status::OK);
  EXPECT_EQ (custody.GetReceived ("bob"), 10);
  EXPECT_EQ (game.GetBalance ("bob"), 0);
  EXPECT_EQ (game.Withdraw (Ctx ("bob")), Status::INSUFFICIENT_FUNDS);
}

TEST_F (RpsGameTests, WithdrawKeepsActiveStake)
{
  PlayUntilDistribute (Choice::ROCK, Choice::SCISSORS);
  ASSERT_EQ (game.Distribute (Ctx ("alice")), Status::OK);
  ASSERT_EQ (CommitChoice ("bob", Choice::PAPER, 110), Status::OK);

  ASSERT_EQ (game.Withdraw (Ctx ("bob")), Status::OK);
  EXPECT_EQ (custody.GetReceived ("bob"), 10);
  EXPECT_EQ (game.GetBalance ("bob"), 110);

  EXPECT_EQ (game.Withdraw (Ctx ("bob")), Status::INSUFFICIENT_FUNDS);
}

TEST_F (RpsGameTests, WithdrawRejected)
{
  PlayUntilDistribute (Choice::ROCK, Choice::SCISSORS);
  ASSERT_EQ (game.Distribute (Ctx ("alice")), Status::OK);

  custody.SetRejecting ("bob", true);
  EXPECT_EQ (game.Withdraw (Ctx ("bob")), Status::TRANSFER_FAILED);
  EXPECT_EQ (game.GetBalance ("bob"), 10);
}

/* ************************************************************************** */

TEST_F (RpsGameTests, ExportRequiresLockAndOperator)
{
  std::string snapshot;
  EXPECT_EQ (game.ExportState (Ctx (OPERATOR), snapshot), Status::NOT_LOCKED);

  ASSERT_EQ (game.Lock (Ctx (OPERATOR)), Status::OK);
  EXPECT_EQ (game.ExportState (Ctx ("alice"), snapshot), Status::UNAUTHORISED);
  EXPECT_EQ (snapshot, "");

  ASSERT_EQ (game.ExportState (Ctx (OPERATOR), snapshot), Status::OK);
  EXPECT_NE (snapshot, "");
}

TEST_F (RpsGameTests, ExportImportRoundtrip)
{
  ASSERT_EQ (CommitChoice ("alice", Choice::ROCK, 110), Status::OK);
  ASSERT_EQ (CommitChoice ("bob", Choice::SCISSORS, 110), Status::OK);
  ASSERT_EQ (RevealChoice ("alice", Choice::ROCK, 10), Status::OK);
  ASSERT_EQ (game.Lock (Ctx (OPERATOR)), Status::OK);

  std::string snapshot;
  ASSERT_EQ (game.ExportState (Ctx (OPERATOR), snapshot), Status::OK);

  wager::MemoryStorage otherStorage;
  wager::MemoryCustody otherCustody;
  RpsGame other(otherStorage, otherCustody, operators);
  ASSERT_EQ (other.Initialise (Ctx (OPERATOR), 1, 1, 1), Status::OK);
  EXPECT_EQ (other.ImportState (Ctx (OPERATOR), snapshot), Status::NOT_LOCKED);
  ASSERT_EQ (other.Lock (Ctx (OPERATOR)), Status::OK);
  ASSERT_EQ (other.ImportState (Ctx (OPERATOR), snapshot), Status::OK);

  EXPECT_EQ (other.GetStateAsJson (), game.GetStateAsJson ());

  ASSERT_EQ (other.Unlock (Ctx (OPERATOR)), Status::OK);
  ASSERT_EQ (other.Reveal (Ctx ("bob", 12), 3, TestBlinding ("bob")),
             Status::OK);
  ASSERT_EQ (other.Distribute (Ctx ("bob")), Status::OK);
  EXPECT_EQ (otherCustody.GetReceived ("alice"), 210);
}

TEST_F (RpsGameTests, ImportInvalidSnapshot)
{
  ASSERT_EQ (game.Lock (Ctx (OPERATOR)), Status::OK);
  const std::string before = GetRawState ();

  EXPECT_EQ (game.ImportState (Ctx (OPERATOR), "invalid"),
             Status::INVALID_SNAPSHOT);
  EXPECT_EQ (game.ImportState (Ctx (OPERATOR), "AAAA\n\n\n\n"),
             Status::INVALID_SNAPSHOT);
  EXPECT_EQ (game.ImportState (Ctx (OPERATOR), "    AAAA"),
             Status::INVALID_SNAPSHOT);
  EXPECT_EQ (game.ImportState (Ctx (OPERATOR),
                               " " + EncodeSnapshot (GetState ()) + "   "),
             Status::INVALID_SNAPSHOT);

  proto::GameState bad = GetState ();
  bad.set_stage (9);
  EXPECT_EQ (game.ImportState (Ctx (OPERATOR), EncodeSnapshot (bad)),
             Status::INVALID_SNAPSHOT);

  EXPECT_EQ (game.ImportState (Ctx ("alice"), EncodeSnapshot (GetState ())),
             Status::UNAUTHORISED);

  EXPECT_EQ (GetRawState (), before);
}

TEST_F (RpsGameTests, ImportedStateIsLocked)
{
  ASSERT_EQ (game.Lock (Ctx (OPERATOR)), Status::OK);

  proto::GameState unlocked = GetState ();
  unlocked.set_locked (false);
  ASSERT_EQ (game.ImportState (Ctx (OPERATOR), EncodeSnapshot (unlocked)),
             Status::OK);
  EXPECT_TRUE (GetState ().locked ());
}

TEST_F (RpsGameTests, InvalidRoundFromImport)
{
  PlayUntilDistribute (Choice::ROCK, Choice::PAPER);
  ASSERT_EQ (game.Lock (Ctx (OPERATOR)), Status::OK);

  proto::GameState state = GetState ();
  state.mutable_slots (0)->clear_choice ();
  state.mutable_slots (1)->clear_choice ();
  ASSERT_EQ (game.ImportState (Ctx (OPERATOR), EncodeSnapshot (state)),
             Status::OK);
  ASSERT_EQ (game.Unlock (Ctx (OPERATOR)), Status::OK);

  ASSERT_EQ (game.Distribute (Ctx ("charly")), Status::OK);
  EXPECT_EQ (custody.GetReceived ("alice"), 10);
  EXPECT_EQ (custody.GetReceived ("bob"), 10);
  EXPECT_EQ (game.GetBalance ("alice"), 100);
  EXPECT_EQ (game.GetBalance ("bob"), 100);
  EXPECT_EQ (TotalAccounted (), 220);
}

/* ************************************************************************** */

/**
 * Runs a full round on SQLite storage, to verify that failed calls are
 * rolled back also there.
 */
TEST (RpsGameSQLiteTests, FullRound)
{
  wager::SQLiteStorage storage(":memory:");
  storage.Initialise ();
  wager::MemoryCustody custody;
  const StaticOperators operators({OPERATOR});
  RpsGame game(storage, custody, operators);

  const auto ctx = [] (const std::string& name, const uint64_t height,
                       const Amount& value)
    {
      return wager::CallContext (name, value, height);
    };

  ASSERT_EQ (game.Initialise (ctx (OPERATOR, 0, 0), 100, 10, 5), Status::OK);

  const auto blindA = TestBlinding ("a");
  const auto blindB = TestBlinding ("b");
  ASSERT_EQ (game.Commit (ctx ("alice", 1, 110),
                          ComputeCommitment (Choice::ROCK, blindA, "alice")),
             Status::OK);
  ASSERT_EQ (game.Commit (ctx ("bob", 2, 110),
                          ComputeCommitment (Choice::SCISSORS, blindB, "bob")),
             Status::OK);

  const std::string before = storage.GetCurrentState ();
  EXPECT_EQ (game.Reveal (ctx ("alice", 3, 0), 2, blindA),
             Status::INVALID_COMMITMENT);
  EXPECT_EQ (storage.GetCurrentState (), before);

  ASSERT_EQ (game.Reveal (ctx ("alice", 3, 0), 1, blindA), Status::OK);
  ASSERT_EQ (game.Reveal (ctx ("bob", 4, 0), 3, blindB), Status::OK);

  custody.SetRejecting ("alice", true);
  EXPECT_EQ (game.Distribute (ctx ("bob", 5, 0)), Status::DISTRIBUTE_FAILED);
  custody.SetRejecting ("alice", false);
  ASSERT_EQ (game.Distribute (ctx ("bob", 5, 0)), Status::OK);

  EXPECT_EQ (custody.GetReceived ("alice"), 210);
  EXPECT_EQ (game.GetBalance ("bob"), 10);
}

} // anonymous namespace
} // namespace rps

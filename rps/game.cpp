// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "game.hpp"

#include "commitment.hpp"
#include "gamestate.hpp"
#include "resolution.hpp"
#include "snapshot.hpp"
#include "statejson.hpp"

#include "wagergame/atomiccall.hpp"

#include <glog/logging.h>

namespace rps
{

using wager::Amount;
using wager::CallContext;
using wager::EscrowLedger;

RpsGame::RpsGame (wager::StorageInterface& s, wager::Custody& c,
                  const OperatorCheck& o)
  : storage(s), custody(c), operators(o)
{}

proto::GameState
RpsGame::GetState () const
{
  proto::GameState res;
  if (storage.HasCurrentState ())
    CHECK (res.ParseFromString (storage.GetCurrentState ()));

  return res;
}

Status
RpsGame::RunOperation (const std::string& name, const CallContext& ctx,
                       const bool payable, const bool needsInit,
                       const Operation& op)
{
  wager::AtomicCall call(storage, custody);

  proto::GameState state = GetState ();

  Status res = Status::OK;
  if (needsInit && !IsInitialised (state))
    res = Status::NOT_INITIALISED;
  else if (!payable && ctx.GetValue () > 0)
    res = Status::NOT_PAYABLE;
  else
    {
      EscrowLedger ledger(*state.mutable_ledger (), custody);
      res = op (state, ledger);
    }

  if (res != Status::OK)
    {
      LOG (WARNING)
          << "Operation " << name << " failed (" << ctx << "): " << res;
      return res;
    }

  std::string data;
  CHECK (state.SerializeToString (&data));
  storage.SetCurrentState (data);
  call.SetSuccess ();

  LOG (INFO) << "Operation " << name << " succeeded (" << ctx << ")";
  VLOG (1) << "New state:\n" << state.DebugString ();

  return Status::OK;
}

Status
RpsGame::CheckOperator (const CallContext& ctx) const
{
  if (!operators.IsOperator (ctx.GetCaller ()))
    {
      LOG (WARNING) << ctx.GetCaller () << " is not an operator";
      return Status::UNAUTHORISED;
    }

  return Status::OK;
}

/* ************************************************************************** */

Status
RpsGame::Initialise (const CallContext& ctx, const Amount& bet,
                     const Amount& deposit, const Amount& revealWindow)
{
  return RunOperation ("initialise", ctx, false, false,
      [&] (proto::GameState& state, EscrowLedger& ledger)
    {
      const Status op = CheckOperator (ctx);
      if (op != Status::OK)
        return op;

      if (IsInitialised (state))
        return Status::ALREADY_INITIALISED;

      if (!GameParameters::IsValid (bet, deposit))
        {
          LOG (WARNING)
              << "Bet " << bet << " and deposit " << deposit
              << " are too large";
          return Status::INVALID_PARAMETERS;
        }

      const GameParameters params(bet, deposit, revealWindow);
      *state.mutable_config () = params.ToProto ();
      SetStage (state, Stage::FIRST_COMMIT);
      state.set_locked (false);

      LOG (INFO)
          << "Initialised game with bet " << bet << ", deposit " << deposit
          << " and reveal window " << revealWindow;
      return Status::OK;
    });
}

Status
RpsGame::SetLocked (const std::string& name, const CallContext& ctx,
                    const bool val)
{
  return RunOperation (name, ctx, false, true,
      [&] (proto::GameState& state, EscrowLedger& ledger)
    {
      const Status op = CheckOperator (ctx);
      if (op != Status::OK)
        return op;

      state.set_locked (val);
      return Status::OK;
    });
}

Status
RpsGame::Lock (const CallContext& ctx)
{
  return SetLocked ("lock", ctx, true);
}

Status
RpsGame::Unlock (const CallContext& ctx)
{
  return SetLocked ("unlock", ctx, false);
}

Status
RpsGame::ExportState (const CallContext& ctx, std::string& snapshot)
{
  return RunOperation ("export", ctx, false, true,
      [&] (proto::GameState& state, EscrowLedger& ledger)
    {
      const Status op = CheckOperator (ctx);
      if (op != Status::OK)
        return op;

      if (!state.locked ())
        return Status::NOT_LOCKED;

      snapshot = EncodeSnapshot (state);
      return Status::OK;
    });
}

Status
RpsGame::ImportState (const CallContext& ctx, const std::string& snapshot)
{
  return RunOperation ("import", ctx, false, true,
      [&] (proto::GameState& state, EscrowLedger& ledger)
    {
      const Status op = CheckOperator (ctx);
      if (op != Status::OK)
        return op;

      if (!state.locked ())
        return Status::NOT_LOCKED;

      proto::GameState imported;
      if (!DecodeSnapshot (snapshot, imported))
        return Status::INVALID_SNAPSHOT;

      imported.set_locked (true);
      state = std::move (imported);

      LOG (INFO) << "Imported state from snapshot";
      return Status::OK;
    });
}

/* ************************************************************************** */

Status
RpsGame::Commit (const CallContext& ctx, const wager::uint256& commitment)
{
  return RunOperation ("commit", ctx, true, true,
      [&] (proto::GameState& state, EscrowLedger& ledger)
    {
      if (state.locked ())
        return Status::LOCKED;

      const Stage stage = GetStage (state);
      if (stage != Stage::FIRST_COMMIT && stage != Stage::SECOND_COMMIT)
        return Status::INVALID_STAGE;

      const std::string& name = ctx.GetCaller ();
      if (name.empty ())
        {
          LOG (WARNING) << "Commit without a caller identity";
          return Status::UNKNOWN_PLAYER;
        }
      if (FindSlot (state, name) >= 0)
        return Status::DUPLICATE_PLAYER;

      const Amount stake = GetParameters (state).GetStake ();
      const Amount& value = ctx.GetValue ();
      if (value < stake)
        {
          LOG (WARNING)
              << "Value " << value << " attached by " << name
              << " does not cover the stake of " << stake;
          return Status::INSUFFICIENT_FUNDS;
        }

      if (!ledger.Deposit (name, value))
        return Status::INVALID_PARAMETERS;
      if (value > stake && !ledger.Payout (name, value - stake))
        return Status::TRANSFER_FAILED;

      auto* slot = state.add_slots ();
      slot->set_name (name);
      slot->set_commitment (commitment.GetBinaryString ());

      SetStage (state, stage == Stage::FIRST_COMMIT
                          ? Stage::SECOND_COMMIT : Stage::FIRST_REVEAL);

      LOG (INFO)
          << name << " committed " << commitment.ToHex ()
          << " with stake " << stake;
      return Status::OK;
    });
}

Status
RpsGame::Reveal (const CallContext& ctx, const uint64_t choice,
                 const wager::uint256& blinding)
{
  return RunOperation ("reveal", ctx, false, true,
      [&] (proto::GameState& state, EscrowLedger& ledger)
    {
      if (state.locked ())
        return Status::LOCKED;

      const Stage stage = GetStage (state);
      if (stage != Stage::FIRST_REVEAL && stage != Stage::SECOND_REVEAL)
        return Status::INVALID_STAGE;

      const Amount height = ctx.GetHeight ();
      if (stage == Stage::SECOND_REVEAL && height > GetRevealDeadline (state))
        {
          LOG (WARNING) << "The reveal deadline has passed";
          return Status::INVALID_STAGE;
        }

      Choice c;
      if (!ChoiceFromInteger (choice, c))
        return Status::INVALID_CHOICE;

      const std::string& name = ctx.GetCaller ();
      const int ind = FindSlot (state, name);
      if (ind < 0)
        return Status::UNKNOWN_PLAYER;

      auto& slot = *state.mutable_slots (ind);
      if (GetChoice (slot) != Choice::NONE)
        return Status::ALREADY_REVEALED;

      wager::uint256 commitment;
      CHECK (commitment.FromBinaryString (slot.commitment ()));
      if (!VerifyCommitment (commitment, c, blinding, name))
        return Status::INVALID_COMMITMENT;

      slot.set_choice (ChoiceToInteger (c));

      if (stage == Stage::FIRST_REVEAL)
        {
          const Amount deadline = wager::SaturatingAdd (
              height, GetParameters (state).GetRevealWindow ());
          SetRevealDeadline (state, deadline);
          SetStage (state, Stage::SECOND_REVEAL);
          LOG (INFO)
              << name << " revealed " << c
              << ", the other player has until height " << deadline;
        }
      else
        {
          SetStage (state, Stage::DISTRIBUTE);
          LOG (INFO) << name << " revealed " << c;
        }

      return Status::OK;
    });
}

Status
RpsGame::ForceForfeit (const CallContext& ctx)
{
  return RunOperation ("forfeit", ctx, false, true,
      [&] (proto::GameState& state, EscrowLedger& ledger)
    {
      if (state.locked ())
        return Status::LOCKED;

      if (GetStage (state) != Stage::SECOND_REVEAL)
        return Status::INVALID_STAGE;

      const Amount deadline = GetRevealDeadline (state);
      if (Amount (ctx.GetHeight ()) <= deadline)
        {
          LOG (WARNING)
              << "Height " << ctx.GetHeight ()
              << " is not past the reveal deadline " << deadline;
          return Status::DEADLINE_NOT_PASSED;
        }

      SetStage (state, Stage::DISTRIBUTE);
      LOG (INFO) << "Reveal deadline " << deadline << " has passed";
      return Status::OK;
    });
}

Status
RpsGame::Distribute (const CallContext& ctx)
{
  return RunOperation ("distribute", ctx, false, true,
      [&] (proto::GameState& state, EscrowLedger& ledger)
    {
      if (state.locked ())
        return Status::LOCKED;

      if (GetStage (state) != Stage::DISTRIBUTE)
        return Status::INVALID_STAGE;

      CHECK_EQ (state.slots_size (), 2);
      const GameParameters params = GetParameters (state);
      const Settlement settlement
          = Settle (GetChoice (state.slots (0)), GetChoice (state.slots (1)),
                    params.GetBet (), params.GetDeposit ());

      for (unsigned i = 0; i < 2; ++i)
        {
          const std::string& name = state.slots (i).name ();
          if (!ledger.Debit (name, params.GetStake ()))
            return Status::DISTRIBUTE_FAILED;
        }

      for (unsigned i = 0; i < 2; ++i)
        {
          const std::string& name = state.slots (i).name ();
          const Amount& payout = settlement.payout[i];

          if (!ledger.Deposit (name, payout + settlement.retained[i]))
            return Status::DISTRIBUTE_FAILED;
          if (payout > 0 && !ledger.Payout (name, payout))
            return Status::DISTRIBUTE_FAILED;
        }

      LOG (INFO)
          << "Distributed round between " << state.slots (0).name ()
          << " and " << state.slots (1).name ()
          << ": " << settlement.outcome;

      state.clear_slots ();
      SetRevealDeadline (state, 0);
      SetStage (state, Stage::FIRST_COMMIT);

      return Status::OK;
    });
}

Status
RpsGame::Withdraw (const CallContext& ctx)
{
  return RunOperation ("withdraw", ctx, false, true,
      [&] (proto::GameState& state, EscrowLedger& ledger)
    {
      if (state.locked ())
        return Status::LOCKED;

      const std::string& name = ctx.GetCaller ();
      Amount available = ledger.GetBalance (name);
      if (FindSlot (state, name) >= 0)
        {
          const Amount stake = GetParameters (state).GetStake ();
          CHECK_GE (available, stake);
          available -= stake;
        }

      if (available == 0)
        return Status::INSUFFICIENT_FUNDS;

      if (!ledger.Payout (name, available))
        return Status::TRANSFER_FAILED;

      return Status::OK;
    });
}

/* ************************************************************************** */

Json::Value
RpsGame::GetStateAsJson () const
{
  return GameStateToJson (GetState ());
}

Amount
RpsGame::GetBalance (const std::string& name) const
{
  proto::GameState state = GetState ();
  EscrowLedger ledger(*state.mutable_ledger (), custody);
  return ledger.GetBalance (name);
}

Amount
RpsGame::GetEscrowTotal () const
{
  proto::GameState state = GetState ();
  EscrowLedger ledger(*state.mutable_ledger (), custody);
  return ledger.GetTotal ();
}

} // namespace rps

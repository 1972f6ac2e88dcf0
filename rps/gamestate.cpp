// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "gamestate.hpp"

#include "wagergame/ledger.hpp"
#include "wagerutil/uint256.hpp"

#include <glog/logging.h>

#include <set>

namespace rps
{

using wager::Amount;

/* ************************************************************************** */

bool
StageFromInteger (const uint32_t val, Stage& s)
{
  if (val > static_cast<uint32_t> (Stage::DISTRIBUTE))
    return false;

  s = static_cast<Stage> (val);
  return true;
}

std::string
StageToString (const Stage s)
{
  switch (s)
    {
    case Stage::FIRST_COMMIT:
      return "first-commit";
    case Stage::SECOND_COMMIT:
      return "second-commit";
    case Stage::FIRST_REVEAL:
      return "first-reveal";
    case Stage::SECOND_REVEAL:
      return "second-reveal";
    case Stage::DISTRIBUTE:
      return "distribute";
    }

  LOG (FATAL) << "Invalid stage: " << static_cast<int> (s);
}

std::ostream&
operator<< (std::ostream& out, const Stage s)
{
  return out << StageToString (s);
}

/* ************************************************************************** */

GameParameters::GameParameters (const Amount& b, const Amount& d,
                                const Amount& w)
  : bet(b), deposit(d), revealWindow(w)
{
  CHECK (IsValid (bet, deposit));
}

bool
GameParameters::IsValid (const Amount& b, const Amount& d)
{
  Amount stake;
  if (!wager::AddAmounts (b, d, stake))
    return false;

  Amount pool;
  return wager::AddAmounts (stake, stake, pool);
}

bool
GameParameters::FromProto (const proto::Config& pb)
{
  Amount b, d, w;
  if (!wager::AmountFromString (pb.bet (), b)
        || !wager::AmountFromString (pb.deposit (), d)
        || !wager::AmountFromString (pb.reveal_window (), w))
    {
      LOG (WARNING) << "Invalid amounts in config:\n" << pb.DebugString ();
      return false;
    }

  if (!IsValid (b, d))
    {
      LOG (WARNING) << "Pool overflows for config:\n" << pb.DebugString ();
      return false;
    }

  bet = b;
  deposit = d;
  revealWindow = w;

  return true;
}

proto::Config
GameParameters::ToProto () const
{
  proto::Config res;
  res.set_bet (wager::AmountToString (bet));
  res.set_deposit (wager::AmountToString (deposit));
  res.set_reveal_window (wager::AmountToString (revealWindow));
  return res;
}

Amount
GameParameters::GetStake () const
{
  return bet + deposit;
}

/* ************************************************************************** */

bool
IsInitialised (const proto::GameState& state)
{
  return state.has_config ();
}

GameParameters
GetParameters (const proto::GameState& state)
{
  CHECK (IsInitialised (state));

  GameParameters res;
  CHECK (res.FromProto (state.config ()));

  return res;
}

Stage
GetStage (const proto::GameState& state)
{
  Stage res;
  CHECK (StageFromInteger (state.stage (), res))
      << "Invalid stage in state: " << state.stage ();
  return res;
}

void
SetStage (proto::GameState& state, const Stage s)
{
  state.set_stage (static_cast<uint32_t> (s));
}

Choice
GetChoice (const proto::Slot& slot)
{
  if (slot.choice () == 0)
    return Choice::NONE;

  Choice res;
  CHECK (ChoiceFromInteger (slot.choice (), res))
      << "Invalid choice in state: " << slot.choice ();
  return res;
}

Amount
GetRevealDeadline (const proto::GameState& state)
{
  if (!state.has_reveal_deadline ())
    return 0;

  Amount res;
  CHECK (wager::AmountFromString (state.reveal_deadline (), res))
      << "Invalid deadline in state: " << state.reveal_deadline ();
  return res;
}

void
SetRevealDeadline (proto::GameState& state, const Amount& val)
{
  if (val == 0)
    state.clear_reveal_deadline ();
  else
    state.set_reveal_deadline (wager::AmountToString (val));
}

int
FindSlot (const proto::GameState& state, const std::string& name)
{
  for (int i = 0; i < state.slots_size (); ++i)
    if (state.slots (i).name () == name)
      return i;

  return -1;
}

/* ************************************************************************** */

namespace
{

/**
 * Returns the number of filled slots that a given stage requires.
 */
int
ExpectedSlots (const Stage s)
{
  switch (s)
    {
    case Stage::FIRST_COMMIT:
      return 0;
    case Stage::SECOND_COMMIT:
      return 1;
    default:
      return 2;
    }
}

/**
 * Checks that the number of revealed choices matches the stage.
 */
bool
RevealsMatchStage (const Stage s, const unsigned revealed)
{
  switch (s)
    {
    case Stage::FIRST_COMMIT:
    case Stage::SECOND_COMMIT:
    case Stage::FIRST_REVEAL:
      return revealed == 0;
    case Stage::SECOND_REVEAL:
      return revealed == 1;
    case Stage::DISTRIBUTE:
      /* Distribution follows two reveals or a forfeit, an imported state
         may also have no reveals at all.  */
      return true;
    }

  return false;
}

} // anonymous namespace

bool
ValidateState (const proto::GameState& state)
{
  if (!IsInitialised (state))
    {
      LOG (WARNING) << "State has no config";
      return false;
    }

  GameParameters params;
  if (!params.FromProto (state.config ()))
    return false;

  Stage stage;
  if (!StageFromInteger (state.stage (), stage))
    {
      LOG (WARNING) << "Invalid stage: " << state.stage ();
      return false;
    }

  Amount deadline = 0;
  if (state.has_reveal_deadline ()
        && !wager::AmountFromString (state.reveal_deadline (), deadline))
    {
      LOG (WARNING) << "Invalid reveal deadline: " << state.reveal_deadline ();
      return false;
    }
  if (deadline != 0
        && (stage != Stage::SECOND_REVEAL && stage != Stage::DISTRIBUTE))
    {
      LOG (WARNING) << "Reveal deadline set in stage " << stage;
      return false;
    }

  if (state.slots_size () != ExpectedSlots (stage))
    {
      LOG (WARNING)
          << "State has " << state.slots_size () << " slots in stage " << stage;
      return false;
    }

  if (!wager::IsValidLedger (state.ledger ()))
    return false;

  const auto& balances = state.ledger ().balances ();
  const Amount stake = params.GetStake ();

  std::set<std::string> names;
  unsigned revealed = 0;
  for (const auto& slot : state.slots ())
    {
      if (slot.name ().empty ())
        {
          LOG (WARNING) << "Slot has empty name";
          return false;
        }
      if (!names.insert (slot.name ()).second)
        {
          LOG (WARNING) << "Duplicate slot name: " << slot.name ();
          return false;
        }

      if (slot.commitment ().size () != wager::uint256::NUM_BYTES)
        {
          LOG (WARNING) << "Invalid commitment for " << slot.name ();
          return false;
        }

      if (slot.choice () != 0)
        {
          Choice c;
          if (!ChoiceFromInteger (slot.choice (), c))
            {
              LOG (WARNING)
                  << "Invalid choice " << slot.choice ()
                  << " for " << slot.name ();
              return false;
            }
          ++revealed;
        }

      /* The ledger data is already validated, so parsing cannot fail.  */
      Amount balance = 0;
      const auto mit = balances.find (slot.name ());
      if (mit != balances.end ())
        CHECK (wager::AmountFromString (mit->second, balance));
      if (balance < stake)
        {
          LOG (WARNING)
              << "Balance " << balance << " of " << slot.name ()
              << " does not cover the stake of " << stake;
          return false;
        }
    }

  if (!RevealsMatchStage (stage, revealed))
    {
      LOG (WARNING) << revealed << " revealed choices in stage " << stage;
      return false;
    }

  return true;
}

/* ************************************************************************** */

} // namespace rps

// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPS_GAMESTATE_HPP
#define RPS_GAMESTATE_HPP

#include "choice.hpp"

#include "proto/rps.pb.h"
#include "wagerutil/amount.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace rps
{

/**
 * The stages a round goes through.  The numeric values are what is
 * stored in the GameState proto.
 */
enum class Stage
{
  FIRST_COMMIT = 0,
  SECOND_COMMIT = 1,
  FIRST_REVEAL = 2,
  SECOND_REVEAL = 3,
  DISTRIBUTE = 4,
};

/**
 * Converts a stored integer to a stage.  Returns false if it is out
 * of range.
 */
bool StageFromInteger (uint32_t val, Stage& s);

/**
 * Returns the name of a stage, e.g. "first-commit".
 */
std::string StageToString (Stage s);

std::ostream& operator<< (std::ostream& out, Stage s);

/**
 * The parameters of a game in parsed form.
 */
class GameParameters
{

private:

  wager::Amount bet;
  wager::Amount deposit;
  wager::Amount revealWindow;

public:

  GameParameters () = default;
  GameParameters (const GameParameters&) = default;
  GameParameters& operator= (const GameParameters&) = default;

  /**
   * Constructs parameters from their values.  The caller must make sure
   * that they are valid (see IsValid).
   */
  explicit GameParameters (const wager::Amount& b, const wager::Amount& d,
                           const wager::Amount& w);

  /**
   * Returns true if the pool of a round, 2 * (bet + deposit), fits into
   * an Amount.
   */
  static bool IsValid (const wager::Amount& b, const wager::Amount& d);

  /**
   * Parses the parameters from a Config proto.  Returns false if the
   * amounts cannot be parsed or are not valid.
   */
  bool FromProto (const proto::Config& pb);

  /**
   * Encodes the parameters into a Config proto.
   */
  proto::Config ToProto () const;

  const wager::Amount&
  GetBet () const
  {
    return bet;
  }

  const wager::Amount&
  GetDeposit () const
  {
    return deposit;
  }

  const wager::Amount&
  GetRevealWindow () const
  {
    return revealWindow;
  }

  /**
   * Returns the amount a player has to put up when committing, i.e.
   * bet plus deposit.
   */
  wager::Amount GetStake () const;

};

/**
 * Returns true if the game state has been initialised.
 */
bool IsInitialised (const proto::GameState& state);

/**
 * Returns the parsed parameters of an initialised state.
 */
GameParameters GetParameters (const proto::GameState& state);

/**
 * Returns the stage of a valid state.
 */
Stage GetStage (const proto::GameState& state);

void SetStage (proto::GameState& state, Stage s);

/**
 * Returns the revealed choice of a slot.
 */
Choice GetChoice (const proto::Slot& slot);

/**
 * Returns the reveal deadline, zero if it is not armed.
 */
wager::Amount GetRevealDeadline (const proto::GameState& state);

void SetRevealDeadline (proto::GameState& state, const wager::Amount& val);

/**
 * Returns the index of the slot filled by the given name, or -1 if the
 * name is not in any slot.
 */
int FindSlot (const proto::GameState& state, const std::string& name);

/**
 * Checks a full game state (e.g. from an imported snapshot) for
 * consistency.  Returns false if anything is wrong with it.
 */
bool ValidateState (const proto::GameState& state);

} // namespace rps

#endif // RPS_GAMESTATE_HPP

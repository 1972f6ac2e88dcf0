// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPS_GAME_HPP
#define RPS_GAME_HPP

#include "operators.hpp"
#include "status.hpp"

#include "proto/rps.pb.h"
#include "wagergame/context.hpp"
#include "wagergame/custody.hpp"
#include "wagergame/ledger.hpp"
#include "wagergame/storage.hpp"
#include "wagerutil/amount.hpp"
#include "wagerutil/uint256.hpp"

#include <json/json.h>

#include <cstdint>
#include <functional>
#include <string>

namespace rps
{

/**
 * A single instance of the two-player commit-reveal game together with
 * its escrow ledger.  The state is kept in the given storage, value is
 * paid out through the given custody.
 *
 * Every operation is atomic:  It either succeeds completely, or returns
 * a failure status without any change to the stored state and without
 * any transfer taking effect.
 */
class RpsGame
{

private:

  /**
   * Type of the callback that implements the actual logic of an operation.
   * It gets a copy of the current state (which it can modify) and a ledger
   * operating on it.
   */
  using Operation
      = std::function<Status (proto::GameState& state,
                              wager::EscrowLedger& ledger)>;

  wager::StorageInterface& storage;
  wager::Custody& custody;
  const OperatorCheck& operators;

  /**
   * Runs an operation atomically.  This takes care of the checks common
   * to all operations (initialisation and attached value), runs the
   * callback and stores the modified state if it returns OK.
   */
  Status RunOperation (const std::string& name, const wager::CallContext& ctx,
                       bool payable, bool needsInit, const Operation& op);

  /**
   * Returns UNAUTHORISED if the caller is not an operator, and OK otherwise.
   */
  Status CheckOperator (const wager::CallContext& ctx) const;

  /**
   * Sets the locked flag to the given value.
   */
  Status SetLocked (const std::string& name, const wager::CallContext& ctx,
                    bool val);

public:

  explicit RpsGame (wager::StorageInterface& s, wager::Custody& c,
                    const OperatorCheck& o);

  RpsGame () = delete;
  RpsGame (const RpsGame&) = delete;
  void operator= (const RpsGame&) = delete;

  /**
   * Sets the game parameters.  This can only be done once and only
   * by an operator.
   */
  Status Initialise (const wager::CallContext& ctx, const wager::Amount& bet,
                     const wager::Amount& deposit,
                     const wager::Amount& revealWindow);

  Status Lock (const wager::CallContext& ctx);
  Status Unlock (const wager::CallContext& ctx);

  /**
   * Exports the full state as snapshot string.  The game must be locked.
   */
  Status ExportState (const wager::CallContext& ctx, std::string& snapshot);

  /**
   * Replaces the full state with the one from a snapshot.  The game must
   * be locked, and stays locked with the new state.
   */
  Status ImportState (const wager::CallContext& ctx,
                      const std::string& snapshot);

  /**
   * Joins the current round with the given commitment.  The attached value
   * must cover the stake, anything beyond it is refunded.
   */
  Status Commit (const wager::CallContext& ctx,
                 const wager::uint256& commitment);

  /**
   * Reveals the caller's choice (as raw integer) and blinding factor.
   */
  Status Reveal (const wager::CallContext& ctx, uint64_t choice,
                 const wager::uint256& blinding);

  /**
   * Ends the reveal phase after the deadline has passed without the
   * second player revealing.
   */
  Status ForceForfeit (const wager::CallContext& ctx);

  /**
   * Settles the finished round, pays out and starts the next round.
   */
  Status Distribute (const wager::CallContext& ctx);

  /**
   * Pays out the caller's balance that is not needed as stake for the
   * current round.
   */
  Status Withdraw (const wager::CallContext& ctx);

  /**
   * Returns the current state.  If the game is not yet initialised, this
   * is an empty proto.
   */
  proto::GameState GetState () const;

  /**
   * Returns the current state as JSON.
   */
  Json::Value GetStateAsJson () const;

  /**
   * Returns the ledger balance of the given identity.
   */
  wager::Amount GetBalance (const std::string& name) const;

  /**
   * Returns the sum of all ledger balances, i.e. the value currently
   * held in escrow.
   */
  wager::Amount GetEscrowTotal () const;

};

} // namespace rps

#endif // RPS_GAME_HPP

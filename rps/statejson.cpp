// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "statejson.hpp"

#include "gamestate.hpp"

#include "wagerutil/amount.hpp"
#include "wagerutil/uint256.hpp"

#include <glog/logging.h>

namespace rps
{

namespace
{

Json::Value
SlotToJson (const proto::Slot& slot)
{
  Json::Value res(Json::objectValue);
  res["name"] = slot.name ();

  wager::uint256 commitment;
  CHECK (commitment.FromBinaryString (slot.commitment ()));
  res["commitment"] = commitment.ToHex ();

  const Choice c = GetChoice (slot);
  if (c == Choice::NONE)
    res["choice"] = Json::Value ();
  else
    res["choice"] = ChoiceToString (c);

  return res;
}

} // anonymous namespace

Json::Value
GameStateToJson (const proto::GameState& state)
{
  Json::Value res(Json::objectValue);
  res["initialised"] = IsInitialised (state);
  if (!IsInitialised (state))
    return res;

  const GameParameters params = GetParameters (state);
  Json::Value config(Json::objectValue);
  config["bet"] = wager::AmountToJson (params.GetBet ());
  config["deposit"] = wager::AmountToJson (params.GetDeposit ());
  config["revealwindow"] = wager::AmountToJson (params.GetRevealWindow ());
  res["config"] = config;

  res["stage"] = StageToString (GetStage (state));
  res["locked"] = state.locked ();
  res["revealdeadline"] = wager::AmountToJson (GetRevealDeadline (state));

  Json::Value slots(Json::arrayValue);
  for (const auto& s : state.slots ())
    slots.append (SlotToJson (s));
  res["slots"] = slots;

  Json::Value balances(Json::objectValue);
  for (const auto& entry : state.ledger ().balances ())
    balances[entry.first] = entry.second;
  res["balances"] = balances;

  return res;
}

} // namespace rps

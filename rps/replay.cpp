// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "replay.hpp"

#include "choice.hpp"
#include "commitment.hpp"

#include "wagerutil/amount.hpp"
#include "wagerutil/jsonutils.hpp"
#include "wagerutil/uint256.hpp"

#include <glog/logging.h>

#include <string>

namespace rps
{

using wager::Amount;

namespace
{

/**
 * Parses an optional amount field of a JSON object.  If the field is
 * missing, the amount is set to zero.
 */
bool
ParseOptionalAmount (const Json::Value& obj, const std::string& key,
                     Amount& res)
{
  if (!obj.isMember (key))
    {
      res = 0;
      return true;
    }

  return wager::AmountFromJson (obj[key], res);
}

/**
 * Parses a required amount field of a JSON object.
 */
bool
ParseAmount (const Json::Value& obj, const std::string& key, Amount& res)
{
  if (!obj.isMember (key))
    return false;

  return wager::AmountFromJson (obj[key], res);
}

/**
 * Parses a required field holding a uint256 as hex string.
 */
bool
ParseHash (const Json::Value& obj, const std::string& key,
           wager::uint256& res)
{
  const auto& val = obj[key];
  if (!val.isString ())
    return false;

  return res.FromHex (val.asString ());
}

/**
 * Parses a required field holding a non-negative integer.
 */
bool
ParseUint64 (const Json::Value& obj, const std::string& key, uint64_t& res)
{
  const auto& val = obj[key];
  if (!wager::IsIntegerValue (val) || !val.isUInt64 ())
    return false;

  res = val.asUInt64 ();
  return true;
}

/**
 * Extracts the call context from a call object.
 */
bool
ParseContext (const Json::Value& call, wager::CallContext& ctx)
{
  const auto& caller = call["caller"];
  if (!caller.isString ())
    return false;

  uint64_t height = 0;
  if (call.isMember ("height") && !ParseUint64 (call, "height", height))
    return false;

  Amount value;
  if (!ParseOptionalAmount (call, "value", value))
    return false;

  ctx = wager::CallContext (caller.asString (), value, height);
  return true;
}

/**
 * Determines the commitment for a commit call.  It is either given
 * directly as "commitment", or computed from "choice" and "blinding".
 */
bool
ParseCommitment (const Json::Value& call, const std::string& committer,
                 wager::uint256& res)
{
  if (call.isMember ("commitment"))
    return ParseHash (call, "commitment", res);

  uint64_t val;
  Choice c;
  wager::uint256 blinding;
  if (!ParseUint64 (call, "choice", val) || !ChoiceFromInteger (val, c)
        || !ParseHash (call, "blinding", blinding))
    return false;

  res = ComputeCommitment (c, blinding, committer);
  return true;
}

/**
 * Returns the result object for a malformed call.
 */
Json::Value
Malformed (const Json::Value& call)
{
  LOG (WARNING) << "Malformed call: " << wager::SerialiseJson (call);

  Json::Value res(Json::objectValue);
  if (call.isObject () && call["op"].isString ())
    res["op"] = call["op"];
  res["status"] = "malformed";

  return res;
}

} // anonymous namespace

Json::Value
CallReplayer::ProcessCall (const Json::Value& call)
{
  if (!call.isObject () || !call["op"].isString ())
    return Malformed (call);

  const std::string op = call["op"].asString ();
  wager::CallContext ctx("", 0, 0);
  if (!ParseContext (call, ctx))
    return Malformed (call);

  Json::Value res(Json::objectValue);
  res["op"] = op;

  Status status;
  if (op == "initialise")
    {
      Amount bet, deposit, window;
      if (!ParseAmount (call, "bet", bet)
            || !ParseAmount (call, "deposit", deposit)
            || !ParseAmount (call, "revealwindow", window))
        return Malformed (call);
      status = game.Initialise (ctx, bet, deposit, window);
    }
  else if (op == "lock")
    status = game.Lock (ctx);
  else if (op == "unlock")
    status = game.Unlock (ctx);
  else if (op == "export")
    {
      std::string snapshot;
      status = game.ExportState (ctx, snapshot);
      if (status == Status::OK)
        res["snapshot"] = snapshot;
    }
  else if (op == "import")
    {
      const auto& snapshot = call["snapshot"];
      if (!snapshot.isString ())
        return Malformed (call);
      status = game.ImportState (ctx, snapshot.asString ());
    }
  else if (op == "commit")
    {
      wager::uint256 commitment;
      if (!ParseCommitment (call, ctx.GetCaller (), commitment))
        return Malformed (call);
      status = game.Commit (ctx, commitment);
    }
  else if (op == "reveal")
    {
      /* Out-of-range choices are passed on, so that they are rejected
         by the game with the proper status.  */
      uint64_t choice;
      wager::uint256 blinding;
      if (!ParseUint64 (call, "choice", choice)
            || !ParseHash (call, "blinding", blinding))
        return Malformed (call);
      status = game.Reveal (ctx, choice, blinding);
    }
  else if (op == "forfeit")
    status = game.ForceForfeit (ctx);
  else if (op == "distribute")
    status = game.Distribute (ctx);
  else if (op == "withdraw")
    status = game.Withdraw (ctx);
  else
    return Malformed (call);

  res["status"] = StatusToString (status);
  return res;
}

Json::Value
CallReplayer::ProcessAll (const Json::Value& calls)
{
  CHECK (calls.isArray ());

  Json::Value res(Json::arrayValue);
  for (const auto& c : calls)
    res.append (ProcessCall (c));

  return res;
}

} // namespace rps

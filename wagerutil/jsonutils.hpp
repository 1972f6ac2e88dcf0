// Copyright (C) 2020-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WAGERUTIL_JSONUTILS_HPP
#define WAGERUTIL_JSONUTILS_HPP

#include <json/json.h>

#include <string>

namespace wager
{

/**
 * Returns true if the given JSON value is a true integer, i.e. really
 * was parsed from an integer literal.  This is in contrast to a value that
 * has isInt() return true, but was actually parsed from a floating-point
 * literal and just happens to be integral.
 */
bool IsIntegerValue (const Json::Value& val);

/**
 * Parses a string as JSON.  Returns false if it is not valid JSON.
 */
bool ParseJson (const std::string& str, Json::Value& res);

/**
 * Serialises a JSON value to a compact string without line breaks, e.g.
 * for log output.
 */
std::string SerialiseJson (const Json::Value& val);

} // namespace wager

#endif // WAGERUTIL_JSONUTILS_HPP

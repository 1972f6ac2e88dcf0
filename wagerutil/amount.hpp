// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WAGERUTIL_AMOUNT_HPP
#define WAGERUTIL_AMOUNT_HPP

#include <boost/multiprecision/cpp_int.hpp>

#include <json/json.h>

#include <string>

namespace wager
{

/**
 * Type used for amounts of value (stakes, balances, transfers) as well as
 * for block-height based deadlines.  It is an unsigned 256-bit integer,
 * which throws instead of wrapping around on overflow.
 */
using Amount = boost::multiprecision::checked_uint256_t;

/**
 * Returns the largest representable amount.
 */
Amount MaxAmount ();

/**
 * Adds two amounts.  Returns false (without touching sum) if the result
 * would not fit into 256 bits.
 */
bool AddAmounts (const Amount& a, const Amount& b, Amount& sum);

/**
 * Returns a + b, or MaxAmount if that overflows.
 */
Amount SaturatingAdd (const Amount& a, const Amount& b);

/**
 * Converts an amount to its canonical decimal representation.
 */
std::string AmountToString (const Amount& n);

/**
 * Parses an amount from a canonical decimal string (only digits, no
 * leading zeros except for "0" itself).  Returns false if the string is
 * not valid or the value does not fit into 256 bits.
 */
bool AmountFromString (const std::string& str, Amount& n);

/**
 * Converts an amount to JSON.  Amounts are always represented as decimal
 * strings, since they can exceed the range of JSON numbers.
 */
Json::Value AmountToJson (const Amount& n);

/**
 * Parses an amount from JSON.  Accepted are non-negative integer literals
 * and canonical decimal strings.  Returns true on success.
 */
bool AmountFromJson (const Json::Value& val, Amount& n);

} // namespace wager

#endif // WAGERUTIL_AMOUNT_HPP

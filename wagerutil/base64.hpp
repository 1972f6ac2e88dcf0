// Copyright (C) 2019-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WAGERUTIL_BASE64_HPP
#define WAGERUTIL_BASE64_HPP

#include <string>

namespace wager
{

/**
 * Encodes the given string (potentially with binary data) into base64,
 * without any line breaks.
 */
std::string EncodeBase64 (const std::string& data);

/**
 * Decodes the given string from base64 format to a string of binary data.
 * Returns false if the decoding failed because of invalid data.  Padding
 * is only accepted at the very end of the input.
 */
bool DecodeBase64 (const std::string& encoded, std::string& data);

} // namespace wager

#endif // WAGERUTIL_BASE64_HPP

// Copyright (C) 2019-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WAGERUTIL_PROTOUTILS_HPP
#define WAGERUTIL_PROTOUTILS_HPP

#include <string>

namespace wager
{

/**
 * Encodes a protocol buffer as base64 string (e.g. suitable for handing
 * out as opaque snapshot or storing in a JSON value).
 */
template <typename Proto>
  std::string ProtoToBase64 (const Proto& msg);

/**
 * Decodes a base64-encoded string into a protocol buffer.  Returns false
 * if either the base64 or the protocol buffer data is invalid, in which
 * case msg is not modified.
 */
template <typename Proto>
  bool ProtoFromBase64 (const std::string& str, Proto& msg);

} // namespace wager

#include "protoutils.tpp"

#endif // WAGERUTIL_PROTOUTILS_HPP

// Copyright (C) 2019-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/* Template implementation code for protoutils.hpp.  */

#include "base64.hpp"

#include <glog/logging.h>

#include <string>
#include <utility>

namespace wager
{

template <typename Proto>
  std::string
  ProtoToBase64 (const Proto& msg)
{
  std::string bytes;
  CHECK (msg.SerializeToString (&bytes))
      << "Serialising " << msg.GetTypeName () << " failed";
  return EncodeBase64 (bytes);
}

template <typename Proto>
  bool
  ProtoFromBase64 (const std::string& str, Proto& msg)
{
  std::string bytes;
  if (!DecodeBase64 (str, bytes))
    return false;

  Proto parsed;
  if (!parsed.ParseFromString (bytes))
    {
      LOG (WARNING) << "Base64 data is not a valid " << msg.GetTypeName ();
      return false;
    }

  msg = std::move (parsed);
  return true;
}

} // namespace wager

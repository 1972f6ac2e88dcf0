// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "context.hpp"

#include <ostream>

namespace wager
{

std::ostream&
operator<< (std::ostream& out, const CallContext& ctx)
{
  out << "call by " << ctx.GetCaller () << " at height " << ctx.GetHeight ();
  if (ctx.GetValue () > 0)
    out << " with value " << ctx.GetValue ();
  return out;
}

} // namespace wager

// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WAGERGAME_CONTEXT_HPP
#define WAGERGAME_CONTEXT_HPP

#include "wagerutil/amount.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>

namespace wager
{

/**
 * Data about a single call into a game, as provided by the host
 * environment:  Who made it, how much value was attached and at what
 * block height it is executed.
 */
class CallContext
{

private:

  /** The identity of the caller.  */
  std::string caller;

  /** The value attached to the call, which is now in custody.  */
  Amount value;

  /** The block height at which the call is executed.  */
  uint64_t height;

public:

  explicit CallContext (const std::string& c, const Amount& v,
                        const uint64_t h)
    : caller(c), value(v), height(h)
  {}

  CallContext () = delete;
  CallContext (const CallContext&) = default;
  CallContext& operator= (const CallContext&) = default;

  const std::string&
  GetCaller () const
  {
    return caller;
  }

  const Amount&
  GetValue () const
  {
    return value;
  }

  uint64_t
  GetHeight () const
  {
    return height;
  }

};

std::ostream& operator<< (std::ostream& out, const CallContext& ctx);

} // namespace wager

#endif // WAGERGAME_CONTEXT_HPP

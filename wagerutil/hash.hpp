// Copyright (C) 2019-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WAGERUTIL_HASH_HPP
#define WAGERUTIL_HASH_HPP

#include "uint256.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

/* OpenSSL's digest context, so that evp.h need not be included here.  */
struct evp_md_ctx_st;

namespace wager
{

/**
 * Incremental SHA-256 hasher.  Data is fed in through operator<<, and
 * Finalise returns the digest as uint256.
 */
class SHA256
{

private:

  struct ContextDeleter
  {
    void operator() (evp_md_ctx_st* ctx) const;
  };

  /**
   * The digest context.  It is reset to null once the hash has been
   * finalised, after which no more data may be added.
   */
  std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx;

  void Update (const void* data, size_t len);

public:

  SHA256 ();

  SHA256 (const SHA256&) = delete;
  void operator= (const SHA256&) = delete;

  SHA256& operator<< (const std::string& data);
  SHA256& operator<< (const uint256& data);
  SHA256& operator<< (uint8_t byte);

  /**
   * Returns the digest of all data added so far.  The hasher cannot be
   * used anymore afterwards.
   */
  uint256 Finalise ();

  /**
   * Hashes a single string.
   */
  static uint256 Hash (const std::string& data);

};

} // namespace wager

#endif // WAGERUTIL_HASH_HPP

// Copyright (C) 2019-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include <glog/logging.h>

#include <openssl/evp.h>

#include <array>

namespace wager
{

static_assert (uint256::NUM_BYTES == 32, "uint256 must hold a SHA-256 digest");

void
SHA256::ContextDeleter::operator() (evp_md_ctx_st* ctx) const
{
  EVP_MD_CTX_free (ctx);
}

SHA256::SHA256 ()
  : ctx(EVP_MD_CTX_new ())
{
  CHECK (ctx != nullptr) << "Failed to allocate digest context";
  CHECK_EQ (EVP_DigestInit_ex (ctx.get (), EVP_sha256 (), nullptr), 1);
}

void
SHA256::Update (const void* data, const size_t len)
{
  CHECK (ctx != nullptr) << "SHA256 hasher used after Finalise";
  CHECK_EQ (EVP_DigestUpdate (ctx.get (), data, len), 1);
}

SHA256&
SHA256::operator<< (const std::string& data)
{
  Update (data.data (), data.size ());
  return *this;
}

SHA256&
SHA256::operator<< (const uint256& data)
{
  Update (data.GetBlob (), uint256::NUM_BYTES);
  return *this;
}

SHA256&
SHA256::operator<< (const uint8_t byte)
{
  Update (&byte, 1);
  return *this;
}

uint256
SHA256::Finalise ()
{
  CHECK (ctx != nullptr) << "SHA256 hasher finalised twice";

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest;
  unsigned len;
  CHECK_EQ (EVP_DigestFinal_ex (ctx.get (), digest.data (), &len), 1);
  CHECK_EQ (len, uint256::NUM_BYTES);
  ctx.reset ();

  uint256 res;
  res.FromBlob (digest.data ());
  return res;
}

uint256
SHA256::Hash (const std::string& data)
{
  SHA256 hasher;
  hasher << data;
  return hasher.Finalise ();
}

} // namespace wager

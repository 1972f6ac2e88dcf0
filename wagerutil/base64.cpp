// Copyright (C) 2019-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "base64.hpp"

#include <openssl/evp.h>

#include <glog/logging.h>

#include <cstddef>
#include <vector>

namespace wager
{

namespace
{

/**
 * Counts the number of trailing padding characters in the encoded
 * data.  Returns false if there is padding in the middle of the
 * string, too much of it, or any character outside the base64
 * alphabet (including whitespace, which OpenSSL would skip).
 */
bool
CountPadding (const std::string& encoded, size_t& padding)
{
  padding = 0;
  for (const char c : encoded)
    {
      if (c == '=')
        {
          ++padding;
          continue;
        }

      if (padding > 0)
        {
          LOG (WARNING) << "Padding in the middle of base64 data";
          return false;
        }

      const bool valid = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
                            || (c >= '0' && c <= '9') || c == '+' || c == '/';
      if (!valid)
        {
          LOG (WARNING)
              << "Invalid character " << static_cast<int> (c)
              << " in base64 data";
          return false;
        }
    }

  if (padding > 2)
    {
      LOG (WARNING) << "Too many padding characters in base64 data";
      return false;
    }

  return true;
}

} // anonymous namespace

std::string
EncodeBase64 (const std::string& data)
{
  /* EVP_EncodeBlock writes four characters for every started block of
     three input bytes plus a terminating NUL, and no newlines.  */
  const size_t bufSize = 4 * ((data.size () + 2) / 3) + 1;

  std::vector<unsigned char> encoded(bufSize, 0);
  const int n
      = EVP_EncodeBlock (encoded.data (),
                         reinterpret_cast<const unsigned char*> (data.data ()),
                         data.size ());
  CHECK_GE (n, 0);
  CHECK_LE (static_cast<size_t> (n) + 1, bufSize);

  return std::string (reinterpret_cast<const char*> (encoded.data ()), n);
}

bool
DecodeBase64 (const std::string& encoded, std::string& data)
{
  if (encoded.size () % 4 != 0)
    {
      LOG (WARNING) << "Base64 data has invalid length " << encoded.size ();
      return false;
    }

  size_t padding;
  if (!CountPadding (encoded, padding))
    return false;

  const size_t outputSize = encoded.size () / 4 * 3;
  std::vector<unsigned char> out(outputSize + 1, 0);

  const int n = EVP_DecodeBlock (
      out.data (), reinterpret_cast<const unsigned char*> (encoded.data ()),
      encoded.size ());
  if (n == -1)
    {
      LOG (WARNING) << "OpenSSL base64 decode returned error";
      return false;
    }
  if (static_cast<size_t> (n) != outputSize)
    {
      LOG (WARNING)
          << "Decoded " << n << " bytes from base64 data, expected "
          << outputSize;
      return false;
    }

  /* EVP_DecodeBlock decodes padding as zero bytes, so strip as many bytes
     off the end as there were padding characters.  */
  CHECK_LE (padding, outputSize);
  data.assign (reinterpret_cast<const char*> (out.data ()),
               outputSize - padding);

  return true;
}

} // namespace wager

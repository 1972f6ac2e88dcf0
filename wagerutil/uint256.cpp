// Copyright (C) 2018-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "uint256.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace wager
{

constexpr size_t uint256::NUM_BYTES;

namespace
{

constexpr char HEX_DIGITS[] = "0123456789abcdef";

/**
 * Returns the value of a hex digit, or -1 if the character is none.
 */
int
HexDigitValue (const char c)
{
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F')
    return 10 + (c - 'A');
  return -1;
}

} // anonymous namespace

std::string
uint256::ToHex () const
{
  std::string res;
  res.reserve (2 * NUM_BYTES);
  for (const unsigned char b : data)
    {
      res.push_back (HEX_DIGITS[b >> 4]);
      res.push_back (HEX_DIGITS[b & 0x0F]);
    }

  return res;
}

bool
uint256::FromHex (const std::string& hex)
{
  if (hex.size () != 2 * NUM_BYTES)
    {
      LOG (WARNING) << "Hex string has wrong length for uint256: " << hex;
      return false;
    }

  decltype (data) parsed;
  for (size_t i = 0; i < NUM_BYTES; ++i)
    {
      const int hi = HexDigitValue (hex[2 * i]);
      const int lo = HexDigitValue (hex[2 * i + 1]);
      if (hi < 0 || lo < 0)
        {
          LOG (WARNING) << "Invalid hex string for uint256: " << hex;
          return false;
        }
      parsed[i] = static_cast<unsigned char> ((hi << 4) | lo);
    }

  data = parsed;
  return true;
}

void
uint256::FromBlob (const unsigned char* blob)
{
  std::copy_n (blob, NUM_BYTES, data.begin ());
}

std::string
uint256::GetBinaryString () const
{
  return std::string (data.begin (), data.end ());
}

bool
uint256::FromBinaryString (const std::string& str)
{
  if (str.size () != NUM_BYTES)
    {
      LOG (WARNING)
          << "Binary string of " << str.size () << " bytes is not a uint256";
      return false;
    }

  std::transform (str.begin (), str.end (), data.begin (),
                  [] (const char c) { return static_cast<unsigned char> (c); });
  return true;
}

} // namespace wager

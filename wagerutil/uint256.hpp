// Copyright (C) 2018-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WAGERUTIL_UINT256_HPP
#define WAGERUTIL_UINT256_HPP

#include <array>
#include <cstddef>
#include <string>

namespace wager
{

/**
 * A fixed 256-bit value as raw big-endian bytes.  It is used for hash
 * commitments and blinding factors and has no arithmetic; numeric
 * amounts use the Amount type instead.  Default-constructed values are
 * all zeros.
 */
class uint256 final
{

public:

  static constexpr size_t NUM_BYTES = 256 / 8;

private:

  std::array<unsigned char, NUM_BYTES> data = {};

public:

  uint256 () = default;
  uint256 (const uint256&) = default;
  uint256& operator= (const uint256&) = default;

  /** Returns the value as lower-case hex string with 64 digits.  */
  std::string ToHex () const;

  /**
   * Parses exactly 64 hex digits (either case).  On failure, false is
   * returned and the value is left unchanged.
   */
  bool FromHex (const std::string& hex);

  /** Raw access to the NUM_BYTES bytes.  */
  const unsigned char*
  GetBlob () const
  {
    return data.data ();
  }

  void FromBlob (const unsigned char* blob);

  /**
   * Returns the bytes as std::string, as stored in protocol buffer
   * bytes fields.
   */
  std::string GetBinaryString () const;

  /**
   * Sets the value from a string of exactly NUM_BYTES bytes.  Returns false
   * (without changing the value) for other lengths.
   */
  bool FromBinaryString (const std::string& str);

  friend bool
  operator== (const uint256& a, const uint256& b)
  {
    return a.data == b.data;
  }

  friend bool
  operator!= (const uint256& a, const uint256& b)
  {
    return !(a == b);
  }

};

} // namespace wager

#endif // WAGERUTIL_UINT256_HPP

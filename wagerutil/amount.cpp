// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "amount.hpp"

#include "jsonutils.hpp"

#include <glog/logging.h>

#include <limits>

namespace wager
{

namespace
{

/** Number of decimal digits in the largest 256-bit value.  */
constexpr size_t MAX_DECIMAL_DIGITS = 78;

} // anonymous namespace

Amount
MaxAmount ()
{
  return std::numeric_limits<Amount>::max ();
}

bool
AddAmounts (const Amount& a, const Amount& b, Amount& sum)
{
  if (a > MaxAmount () - b)
    return false;

  sum = a + b;
  return true;
}

Amount
SaturatingAdd (const Amount& a, const Amount& b)
{
  Amount res;
  if (!AddAmounts (a, b, res))
    return MaxAmount ();
  return res;
}

std::string
AmountToString (const Amount& n)
{
  return n.str ();
}

bool
AmountFromString (const std::string& str, Amount& n)
{
  if (str.empty () || str.size () > MAX_DECIMAL_DIGITS)
    {
      VLOG (1) << "Invalid length for amount string: " << str.size ();
      return false;
    }

  for (const char c : str)
    if (c < '0' || c > '9')
      {
        VLOG (1) << "Invalid character in amount string: " << str;
        return false;
      }

  if (str.size () > 1 && str[0] == '0')
    {
      VLOG (1) << "Amount string has leading zeros: " << str;
      return false;
    }

  const boost::multiprecision::cpp_int value(str);
  if (value > boost::multiprecision::cpp_int (MaxAmount ()))
    {
      VLOG (1) << "Amount is out of range: " << str;
      return false;
    }

  n = static_cast<Amount> (value);
  return true;
}

Json::Value
AmountToJson (const Amount& n)
{
  return AmountToString (n);
}

bool
AmountFromJson (const Json::Value& val, Amount& n)
{
  if (IsIntegerValue (val))
    {
      if (!val.isUInt64 ())
        {
          LOG (WARNING) << "Amount is negative: " << val;
          return false;
        }
      n = val.asUInt64 ();
      return true;
    }

  if (val.isString ())
    {
      if (!AmountFromString (val.asString (), n))
        {
          LOG (WARNING) << "Invalid amount string: " << val;
          return false;
        }
      return true;
    }

  LOG (WARNING) << "JSON value for amount is not integer or string: " << val;
  return false;
}

} // namespace wager

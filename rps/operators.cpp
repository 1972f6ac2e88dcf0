// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "operators.hpp"

#include <sstream>

namespace rps
{

bool
StaticOperators::IsOperator (const std::string& name) const
{
  return operators.count (name) > 0;
}

std::set<std::string>
ParseNameList (const std::string& list)
{
  std::set<std::string> res;

  std::istringstream in(list);
  std::string entry;
  while (std::getline (in, entry, ','))
    if (!entry.empty ())
      res.insert (entry);

  return res;
}

} // namespace rps

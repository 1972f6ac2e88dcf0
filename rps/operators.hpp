// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef RPS_OPERATORS_HPP
#define RPS_OPERATORS_HPP

#include <set>
#include <string>

namespace rps
{

/**
 * Interface for deciding which callers hold the administrative capability
 * (initialising, locking and snapshots).
 */
class OperatorCheck
{

public:

  virtual ~OperatorCheck () = default;

  /**
   * Returns true if the given identity is an operator.
   */
  virtual bool IsOperator (const std::string& name) const = 0;

};

/**
 * OperatorCheck based on a fixed set of names.
 */
class StaticOperators : public OperatorCheck
{

private:

  std::set<std::string> operators;

public:

  StaticOperators () = default;

  explicit StaticOperators (const std::set<std::string>& ops)
    : operators(ops)
  {}

  bool IsOperator (const std::string& name) const override;

};

/**
 * Parses a comma-separated list of names (as given on the command line)
 * into a set.  Empty entries are ignored.
 */
std::set<std::string> ParseNameList (const std::string& list);

} // namespace rps

#endif // RPS_OPERATORS_HPP

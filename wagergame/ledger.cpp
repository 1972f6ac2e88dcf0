// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger.hpp"

#include <glog/logging.h>

namespace wager
{

Amount
EscrowLedger::GetBalance (const std::string& name) const
{
  const auto mit = data.balances ().find (name);
  if (mit == data.balances ().end ())
    return 0;

  Amount res;
  CHECK (AmountFromString (mit->second, res))
      << "Invalid balance stored for " << name << ": " << mit->second;
  return res;
}

Amount
EscrowLedger::GetTotal () const
{
  Amount res = 0;
  for (const auto& entry : data.balances ())
    res += GetBalance (entry.first);
  return res;
}

void
EscrowLedger::SetBalance (const std::string& name, const Amount& balance)
{
  if (balance == 0)
    data.mutable_balances ()->erase (name);
  else
    (*data.mutable_balances ())[name] = AmountToString (balance);
}

bool
EscrowLedger::Deposit (const std::string& name, const Amount& amount)
{
  Amount newBalance;
  if (!AddAmounts (GetBalance (name), amount, newBalance))
    {
      LOG (WARNING)
          << "Deposit of " << amount << " for " << name << " overflows";
      return false;
    }

  SetBalance (name, newBalance);
  VLOG (1) << "Credited " << amount << " to " << name;
  return true;
}

bool
EscrowLedger::Debit (const std::string& name, const Amount& amount)
{
  const Amount oldBalance = GetBalance (name);
  if (oldBalance < amount)
    {
      LOG (WARNING)
          << "Cannot debit " << amount << " from " << name
          << ", the balance is only " << oldBalance;
      return false;
    }

  SetBalance (name, oldBalance - amount);
  VLOG (1) << "Debited " << amount << " from " << name;
  return true;
}

bool
EscrowLedger::Payout (const std::string& name, const Amount& amount)
{
  const Amount oldBalance = GetBalance (name);
  if (oldBalance < amount)
    {
      LOG (WARNING)
          << "Cannot pay out " << amount << " to " << name
          << ", the balance is only " << oldBalance;
      return false;
    }

  if (!custody.Transfer (name, amount))
    {
      LOG (WARNING) << "Transfer of " << amount << " to " << name << " failed";
      return false;
    }

  SetBalance (name, oldBalance - amount);
  LOG (INFO) << "Paid out " << amount << " to " << name;
  return true;
}

bool
IsValidLedger (const proto::LedgerData& data)
{
  Amount total = 0;
  for (const auto& entry : data.balances ())
    {
      Amount balance;
      if (!AmountFromString (entry.second, balance))
        {
          LOG (WARNING)
              << "Invalid balance for " << entry.first << ": " << entry.second;
          return false;
        }
      if (balance == 0)
        {
          LOG (WARNING) << "Explicit zero balance for " << entry.first;
          return false;
        }
      if (!AddAmounts (total, balance, total))
        {
          LOG (WARNING) << "Total ledger balance overflows";
          return false;
        }
    }

  return true;
}

} // namespace wager

// Copyright (C) 2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "custody.hpp"

#include <glog/logging.h>

namespace wager
{

void
MemoryCustody::SetRejecting (const std::string& recipient, const bool reject)
{
  if (reject)
    rejecting.insert (recipient);
  else
    rejecting.erase (recipient);
}

Amount
MemoryCustody::GetReceived (const std::string& recipient) const
{
  const auto mit = received.find (recipient);
  if (mit == received.end ())
    return 0;
  return mit->second;
}

Amount
MemoryCustody::GetTotalDelivered () const
{
  Amount res = 0;
  for (const auto& entry : received)
    res += entry.second;
  return res;
}

void
MemoryCustody::BeginBatch ()
{
  CHECK (!inBatch);
  CHECK (pending.empty ());
  inBatch = true;
}

bool
MemoryCustody::Transfer (const std::string& recipient, const Amount& amount)
{
  CHECK (inBatch);

  if (rejecting.count (recipient) > 0)
    {
      LOG (WARNING)
          << "Recipient " << recipient << " rejected transfer of " << amount;
      return false;
    }

  VLOG (1) << "Queued transfer of " << amount << " to " << recipient;
  pending.emplace_back (recipient, amount);
  return true;
}

void
MemoryCustody::CommitBatch ()
{
  CHECK (inBatch);

  for (const auto& p : pending)
    {
      received[p.first] += p.second;
      LOG (INFO) << "Delivered " << p.second << " to " << p.first;
    }

  pending.clear ();
  inBatch = false;
}

void
MemoryCustody::AbortBatch ()
{
  CHECK (inBatch);

  LOG_IF (INFO, !pending.empty ())
      << "Dropping " << pending.size () << " queued transfers";

  pending.clear ();
  inBatch = false;
}

} // namespace wager

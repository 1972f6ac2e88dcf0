// Copyright (C) 2018-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "atomiccall.hpp"

#include <glog/logging.h>

namespace wager
{

AtomicCall::AtomicCall (StorageInterface& s, Custody& c)
  : storage(s), custody(c)
{
  storage.BeginTransaction ();
  custody.BeginBatch ();
}

AtomicCall::~AtomicCall ()
{
  if (success)
    {
      /* Transfers are only released once the state is stored.  */
      storage.CommitTransaction ();
      custody.CommitBatch ();
      return;
    }

  VLOG (1) << "Rolling back unsuccessful call";
  custody.AbortBatch ();
  storage.RollbackTransaction ();
}

} // namespace wager

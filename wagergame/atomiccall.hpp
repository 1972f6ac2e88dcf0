// Copyright (C) 2018-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WAGERGAME_ATOMICCALL_HPP
#define WAGERGAME_ATOMICCALL_HPP

#include "custody.hpp"
#include "storage.hpp"

namespace wager
{

/**
 * Helper class that makes one call into a game atomic, based on RAII
 * semantics.  It starts a transaction on the storage and a batch on the
 * custody.  If SetSuccess is called before it goes out of scope, both
 * are committed.  Otherwise, both are rolled back, so that neither state
 * changes nor transfers of the call take effect.
 */
class AtomicCall
{

private:

  /** The storage on which the transaction is running.  */
  StorageInterface& storage;

  /** The custody on which the transfer batch is open.  */
  Custody& custody;

  /**
   * Whether the operation was successful.  If this is set to true at some
   * point in time, then both the transaction and batch will be committed.
   */
  bool success = false;

public:

  explicit AtomicCall (StorageInterface& s, Custody& c);
  ~AtomicCall ();

  AtomicCall () = delete;
  AtomicCall (const AtomicCall&) = delete;
  void operator= (const AtomicCall&) = delete;

  void
  SetSuccess ()
  {
    success = true;
  }

};

} // namespace wager

#endif // WAGERGAME_ATOMICCALL_HPP

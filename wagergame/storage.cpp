// Copyright (C) 2018-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "storage.hpp"

#include <glog/logging.h>

#include <utility>

namespace wager
{

void
MemoryStorage::Initialise ()
{}

void
MemoryStorage::Clear ()
{
  CHECK (!inTransaction) << "Storage cleared inside a transaction";
  current = Content ();
}

bool
MemoryStorage::HasCurrentState () const
{
  return current.present;
}

GameStateData
MemoryStorage::GetCurrentState () const
{
  CHECK (current.present) << "No game state stored";
  return current.data;
}

void
MemoryStorage::SetCurrentState (const GameStateData& data)
{
  CHECK (inTransaction) << "Game state must be changed in a transaction";
  current.present = true;
  current.data = data;
}

void
MemoryStorage::BeginTransaction ()
{
  CHECK (!inTransaction);
  backup = current;
  inTransaction = true;
}

void
MemoryStorage::CommitTransaction ()
{
  CHECK (inTransaction);
  backup = Content ();
  inTransaction = false;
}

void
MemoryStorage::RollbackTransaction ()
{
  CHECK (inTransaction);
  current = std::move (backup);
  backup = Content ();
  inTransaction = false;

  VLOG (1) << "Rolled back in-memory transaction";
}

} // namespace wager

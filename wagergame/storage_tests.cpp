// Copyright (C) 2018-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "storage_tests.hpp"

#include <gtest/gtest.h>

namespace wager
{
namespace
{

INSTANTIATE_TYPED_TEST_CASE_P (Memory, StorageInterfaceTests, MemoryStorage);

TEST (MemoryStorageTests, RollbackAfterClear)
{
  MemoryStorage storage;
  storage.Initialise ();

  storage.BeginTransaction ();
  storage.SetCurrentState ("old");
  storage.CommitTransaction ();
  storage.Clear ();

  storage.BeginTransaction ();
  storage.SetCurrentState ("new");
  storage.RollbackTransaction ();

  EXPECT_FALSE (storage.HasCurrentState ());
}

} // anonymous namespace
} // namespace wager

// Copyright (C) 2018-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WAGERGAME_STORAGE_HPP
#define WAGERGAME_STORAGE_HPP

#include <string>

namespace wager
{

/**
 * The serialised game state, as stored.  It is an opaque byte string
 * to the storage layer.
 */
using GameStateData = std::string;

/**
 * Durable storage of a single game state.  Every change is made inside a
 * transaction, which is either committed or rolled back as a whole.
 * Transactions are not nested.
 *
 * Implementations are not thread-safe.
 */
class StorageInterface
{

public:

  virtual ~StorageInterface () = default;

  /**
   * Prepares the storage for use (e.g. opens files).  Must be called
   * before any other method.
   */
  virtual void Initialise () = 0;

  /**
   * Removes the stored state.  Must not be called inside a transaction.
   */
  virtual void Clear () = 0;

  virtual bool HasCurrentState () const = 0;

  /**
   * Returns the stored state.  Must not be called if there is none.
   */
  virtual GameStateData GetCurrentState () const = 0;

  /**
   * Replaces the stored state.  Must be called inside a transaction.
   */
  virtual void SetCurrentState (const GameStateData& data) = 0;

  virtual void BeginTransaction () = 0;
  virtual void CommitTransaction () = 0;

  /**
   * Reverts the state to what it was when the transaction started.
   */
  virtual void RollbackTransaction () = 0;

};

/**
 * StorageInterface that keeps the state in memory only.  For rollbacks, the
 * content at the start of the current transaction is kept aside.
 */
class MemoryStorage : public StorageInterface
{

private:

  /**
   * Content of the storage:  The state itself, and whether there is one
   * at all.
   */
  struct Content
  {
    bool present = false;
    GameStateData data;
  };

  Content current;

  /** The content at the start of the open transaction.  */
  Content backup;

  bool inTransaction = false;

public:

  MemoryStorage () = default;
  MemoryStorage (const MemoryStorage&) = delete;
  void operator= (const MemoryStorage&) = delete;

  void Initialise () override;
  void Clear () override;

  bool HasCurrentState () const override;
  GameStateData GetCurrentState () const override;
  void SetCurrentState (const GameStateData& data) override;

  void BeginTransaction () override;
  void CommitTransaction () override;
  void RollbackTransaction () override;

};

} // namespace wager

#endif // WAGERGAME_STORAGE_HPP

// Copyright (C) 2018-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WAGERGAME_SQLITESTORAGE_HPP
#define WAGERGAME_SQLITESTORAGE_HPP

#include "storage.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace wager
{

/**
 * An open SQLite connection.  Errors from SQLite are not expected in
 * normal operation and abort the process.
 */
class SQLiteDatabase
{

public:

  class Statement;

private:

  struct Closer
  {
    void operator() (sqlite3* db) const;
  };

  std::unique_ptr<sqlite3, Closer> db;

public:

  /**
   * Opens (and if necessary creates) the database file.  ":memory:" gives
   * a temporary in-memory database.
   */
  explicit SQLiteDatabase (const std::string& file);

  SQLiteDatabase () = delete;
  SQLiteDatabase (const SQLiteDatabase&) = delete;
  void operator= (const SQLiteDatabase&) = delete;

  /**
   * Runs one or more SQL statements that return no rows.
   */
  void Execute (const std::string& sql);

  Statement Prepare (const std::string& sql);

};

/**
 * A prepared statement, finalised when it goes out of scope.
 */
class SQLiteDatabase::Statement
{

private:

  struct Finaliser
  {
    void operator() (sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, Finaliser> stmt;

  explicit Statement (sqlite3_stmt* s)
    : stmt(s)
  {}

  friend class SQLiteDatabase;

public:

  Statement (Statement&&) = default;
  Statement& operator= (Statement&&) = default;

  /**
   * Advances to the next result row.  Returns false once all rows
   * have been returned.
   */
  bool Step ();

  /**
   * Runs a statement that is expected to return no rows.
   */
  void Execute ();

  void BindBlob (int ind, const std::string& val);
  void BindInt (int ind, int64_t val);

  std::string GetBlob (int ind) const;
  int64_t GetInt (int ind) const;

};

/**
 * StorageInterface backed by an SQLite database.  The state is a single
 * row in the table `wagergame_current`, and transactions use a savepoint.
 */
class SQLiteStorage : public StorageInterface
{

private:

  const std::string filename;

  /** The connection, opened by Initialise.  */
  std::unique_ptr<SQLiteDatabase> db;

  bool inTransaction = false;

  SQLiteDatabase& GetDatabase () const;

public:

  explicit SQLiteStorage (const std::string& f)
    : filename(f)
  {}

  ~SQLiteStorage ();

  SQLiteStorage () = delete;
  SQLiteStorage (const SQLiteStorage&) = delete;
  void operator= (const SQLiteStorage&) = delete;

  /**
   * Opens the database and creates the table if it does not exist yet.
   */
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

#endif // WAGERGAME_SQLITESTORAGE_HPP

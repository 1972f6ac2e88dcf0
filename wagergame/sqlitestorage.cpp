// Copyright (C) 2018-2024 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "sqlitestorage.hpp"

#include <glog/logging.h>

#include <cstddef>
#include <limits>

namespace wager
{

namespace
{

/** Key of the row holding the game state.  */
constexpr int64_t STATE_ROW = 1;

/** Name of the savepoint used for transactions.  */
constexpr const char* SAVEPOINT = "`wagergame-call`";

void
LogSQLiteError (void* arg, const int code, const char* msg)
{
  LOG (ERROR) << "SQLite error " << code << ": " << msg;
}

/**
 * Routes SQLite's error log to glog.  This has to happen before the
 * first connection is opened, so it runs once from SQLiteDatabase's
 * constructor.
 */
bool
ConfigureSQLite ()
{
  LOG (INFO)
      << "SQLite header version " << SQLITE_VERSION
      << ", library version " << sqlite3_libversion ();
  CHECK_EQ (SQLITE_VERSION_NUMBER, sqlite3_libversion_number ())
      << "SQLite header and library versions differ";

  const int rc = sqlite3_config (SQLITE_CONFIG_LOG, &LogSQLiteError, nullptr);
  LOG_IF (WARNING, rc != SQLITE_OK)
      << "Could not install SQLite error logger: " << rc;

  return true;
}

} // anonymous namespace

/* ************************************************************************** */

void
SQLiteDatabase::Closer::operator() (sqlite3* db) const
{
  const int rc = sqlite3_close (db);
  LOG_IF (ERROR, rc != SQLITE_OK) << "Closing SQLite database failed: " << rc;
}

void
SQLiteDatabase::Statement::Finaliser::operator() (sqlite3_stmt* stmt) const
{
  /* The result of sqlite3_finalize only repeats the last step's error,
     which has been handled already.  */
  sqlite3_finalize (stmt);
}

SQLiteDatabase::SQLiteDatabase (const std::string& file)
{
  static const bool configured = ConfigureSQLite ();
  CHECK (configured);

  sqlite3* handle = nullptr;
  const int rc
      = sqlite3_open_v2 (file.c_str (), &handle,
                         SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  db.reset (handle);
  CHECK_EQ (rc, SQLITE_OK) << "Could not open SQLite database " << file;

  LOG (INFO) << "Opened SQLite database " << file;
}

void
SQLiteDatabase::Execute (const std::string& sql)
{
  char* err = nullptr;
  const int rc = sqlite3_exec (db.get (), sql.c_str (), nullptr, nullptr, &err);
  if (rc != SQLITE_OK)
    {
      const std::string msg = (err != nullptr ? err : "unknown error");
      sqlite3_free (err);
      LOG (FATAL) << "Executing SQL failed: " << msg << "\n" << sql;
    }
}

SQLiteDatabase::Statement
SQLiteDatabase::Prepare (const std::string& sql)
{
  sqlite3_stmt* stmt = nullptr;
  CHECK_EQ (sqlite3_prepare_v2 (db.get (), sql.c_str (), -1, &stmt, nullptr),
            SQLITE_OK)
      << "Invalid SQL statement:\n" << sql;

  return Statement (stmt);
}

bool
SQLiteDatabase::Statement::Step ()
{
  const int rc = sqlite3_step (stmt.get ());
  if (rc == SQLITE_ROW)
    return true;

  CHECK_EQ (rc, SQLITE_DONE)
      << "Stepping SQL statement failed:\n" << sqlite3_sql (stmt.get ());
  return false;
}

void
SQLiteDatabase::Statement::Execute ()
{
  CHECK (!Step ()) << "Statement returned rows:\n" << sqlite3_sql (stmt.get ());
}

void
SQLiteDatabase::Statement::BindBlob (const int ind, const std::string& val)
{
  CHECK_LE (val.size (),
            static_cast<size_t> (std::numeric_limits<int>::max ()));
  CHECK_EQ (sqlite3_bind_blob (stmt.get (), ind, val.data (),
                               static_cast<int> (val.size ()),
                               SQLITE_TRANSIENT),
            SQLITE_OK);
}

void
SQLiteDatabase::Statement::BindInt (const int ind, const int64_t val)
{
  CHECK_EQ (sqlite3_bind_int64 (stmt.get (), ind, val), SQLITE_OK);
}

std::string
SQLiteDatabase::Statement::GetBlob (const int ind) const
{
  /* sqlite3_column_bytes must be called after sqlite3_column_blob.  */
  const auto* data
      = static_cast<const char*> (sqlite3_column_blob (stmt.get (), ind));
  const int len = sqlite3_column_bytes (stmt.get (), ind);
  if (len == 0)
    return "";

  CHECK (data != nullptr);
  return std::string (data, len);
}

int64_t
SQLiteDatabase::Statement::GetInt (const int ind) const
{
  return sqlite3_column_int64 (stmt.get (), ind);
}

/* ************************************************************************** */

SQLiteStorage::~SQLiteStorage ()
{
  CHECK (!inTransaction) << "SQLiteStorage destroyed with open transaction";
}

SQLiteDatabase&
SQLiteStorage::GetDatabase () const
{
  CHECK (db != nullptr) << "SQLiteStorage has not been initialised";
  return *db;
}

void
SQLiteStorage::Initialise ()
{
  if (db != nullptr)
    return;

  db = std::make_unique<SQLiteDatabase> (filename);
  db->Execute (R"(
    CREATE TABLE IF NOT EXISTS `wagergame_current` (
      `id` INTEGER PRIMARY KEY,
      `state` BLOB NOT NULL
    );
  )");
}

void
SQLiteStorage::Clear ()
{
  CHECK (!inTransaction);
  GetDatabase ().Execute ("DELETE FROM `wagergame_current`");
  LOG (INFO) << "Cleared game state in " << filename;
}

bool
SQLiteStorage::HasCurrentState () const
{
  auto stmt = GetDatabase ().Prepare (R"(
    SELECT COUNT(*) FROM `wagergame_current` WHERE `id` = ?1
  )");
  stmt.BindInt (1, STATE_ROW);

  CHECK (stmt.Step ());
  const int64_t cnt = stmt.GetInt (0);
  CHECK (!stmt.Step ());

  return cnt > 0;
}

GameStateData
SQLiteStorage::GetCurrentState () const
{
  auto stmt = GetDatabase ().Prepare (R"(
    SELECT `state` FROM `wagergame_current` WHERE `id` = ?1
  )");
  stmt.BindInt (1, STATE_ROW);

  CHECK (stmt.Step ()) << "No game state stored in " << filename;
  GameStateData res = stmt.GetBlob (0);
  CHECK (!stmt.Step ());

  return res;
}

void
SQLiteStorage::SetCurrentState (const GameStateData& data)
{
  CHECK (inTransaction) << "Game state must be changed in a transaction";

  auto stmt = GetDatabase ().Prepare (R"(
    INSERT OR REPLACE INTO `wagergame_current` (`id`, `state`)
      VALUES (?1, ?2)
  )");
  stmt.BindInt (1, STATE_ROW);
  stmt.BindBlob (2, data);
  stmt.Execute ();
}

void
SQLiteStorage::BeginTransaction ()
{
  CHECK (!inTransaction);
  GetDatabase ().Execute (std::string ("SAVEPOINT ") + SAVEPOINT);
  inTransaction = true;
}

void
SQLiteStorage::CommitTransaction ()
{
  CHECK (inTransaction);
  GetDatabase ().Execute (std::string ("RELEASE ") + SAVEPOINT);
  inTransaction = false;
}

void
SQLiteStorage::RollbackTransaction ()
{
  CHECK (inTransaction);

  /* ROLLBACK TO leaves the savepoint open, so it is released after.  */
  GetDatabase ().Execute (std::string ("ROLLBACK TO ") + SAVEPOINT);
  GetDatabase ().Execute (std::string ("RELEASE ") + SAVEPOINT);

  inTransaction = false;
}

} // namespace wager

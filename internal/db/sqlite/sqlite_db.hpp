#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <mutex>
#include <string>

namespace tierbridge::db::sqlite {

// Bumped whenever SQLITE_SCHEMA_DDL changes shape.
inline constexpr int kSchemaVersion = 2;

struct SqliteOptions {
  std::string   path;
  std::uint32_t busy_timeout_ms = 5000;
};

/*
  The daemon's SQLite connection.

  Opening applies the connection pragmas and bootstraps the schema, so the
  handle is ready for SqliteRepository once the constructor returns.

  WAL with synchronous=NORMAL: power loss may drop the last persisted
  parts of a transfer, and resume re-sends them. Lock contention waits up
  to busy_timeout_ms.

  Transactions serialize on TxMutex(); one connection has no nested BEGIN.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  const SqliteOptions& Options() const {
    return options_;
  }

  void Exec(const std::string& sql);

  // Highest version recorded in tierbridge_schema_migrations.
  int SchemaVersion();

 private:
  void ApplyPragmas();
  void Bootstrap();

  SqliteOptions options_;
  sqlite3*      db_ = nullptr;
  std::mutex    tx_mutex_;
};

} // namespace tierbridge::db::sqlite

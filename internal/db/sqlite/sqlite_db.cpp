#include "sqlite_db.hpp"

#include <stdexcept>
#include <utility>

#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace tierbridge::db::sqlite {

using observability::IntField;
using observability::StringField;

namespace {

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteDB::SqliteDB(SqliteOptions options) : options_(std::move(options)) {
  if (options_.path.empty()) {
    throw std::invalid_argument("sqlite path is empty");
  }

  int rc = sqlite3_open_v2(options_.path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("open " + options_.path + ": " + msg);
  }

  try {
    ApplyPragmas();
    Bootstrap();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }

  TIERBRIDGE_LOG_INFO("sqlite opened", {StringField("path", options_.path), IntField("schema_version", kSchemaVersion),
                                        IntField("busy_timeout_ms", options_.busy_timeout_ms)});
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

int SqliteDB::SchemaVersion() {
  sqlite3_stmt* stmt = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, "SELECT COALESCE(MAX(version),0) FROM tierbridge_schema_migrations", -1, &stmt, nullptr), db_,
          "schema version");
  int version = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    version = sqlite3_column_int(stmt, 0);
  }
  sqlite3_finalize(stmt);
  return version;
}

void SqliteDB::ApplyPragmas() {
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout_ms)), db_, "busy_timeout");
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::Bootstrap() {
  std::lock_guard lock(tx_mutex_);
  Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto* sql : sql::SQLITE_SCHEMA_DDL) {
      Exec(sql);
    }
    Exec("INSERT OR IGNORE INTO tierbridge_schema_migrations(version,applied_at_ms) VALUES(" + std::to_string(kSchemaVersion) + "," +
         std::to_string(util::NowMillis()) + ");");
    Exec("COMMIT;");
  } catch (...) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

} // namespace tierbridge::db::sqlite

#pragma once

namespace tierbridge::db::sql {

/*
  Schema bootstrap, applied with IF NOT EXISTS on every start.
  Column order matches sql_queries.hpp.
*/

static constexpr const char* SQLITE_SCHEMA_DDL[] = {
    "CREATE TABLE IF NOT EXISTS transfers (id TEXT PRIMARY KEY, kind INTEGER NOT NULL, source_id TEXT NOT NULL, local_path TEXT NOT NULL, "
    "remote_path TEXT NOT NULL, total_size INTEGER NOT NULL, bytes_transferred INTEGER NOT NULL, part_index INTEGER NOT NULL, total_parts "
    "INTEGER NOT NULL, part_size INTEGER NOT NULL, status INTEGER NOT NULL, error TEXT NOT NULL DEFAULT '', error_code INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, "
    "updated_at_ms INTEGER NOT NULL, completed_at_ms INTEGER NOT NULL DEFAULT 0);",
    "CREATE TABLE IF NOT EXISTS operations (id TEXT PRIMARY KEY, type INTEGER NOT NULL, source_id TEXT NOT NULL, source_category INTEGER NOT "
    "NULL, source_path TEXT NOT NULL, dest_path TEXT NOT NULL, file_size INTEGER NOT NULL, bytes_processed INTEGER NOT NULL, status INTEGER NOT "
    "NULL, error TEXT NOT NULL DEFAULT '', started_at_ms INTEGER NOT NULL, completed_at_ms INTEGER NOT NULL DEFAULT 0, seq INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS operations_seq_idx ON operations(seq);",
    "CREATE TABLE IF NOT EXISTS file_tiers (source_id TEXT NOT NULL, path TEXT NOT NULL, tier INTEGER NOT NULL, updated_at_ms INTEGER NOT "
    "NULL, PRIMARY KEY (source_id, path));",
    "CREATE TABLE IF NOT EXISTS tierbridge_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
};

static constexpr const char* POSTGRES_SCHEMA[] = {
    "CREATE TABLE IF NOT EXISTS transfers (id TEXT PRIMARY KEY, kind SMALLINT NOT NULL, source_id TEXT NOT NULL, local_path TEXT NOT NULL, "
    "remote_path TEXT NOT NULL, total_size BIGINT NOT NULL, bytes_transferred BIGINT NOT NULL, part_index INTEGER NOT NULL, total_parts "
    "INTEGER NOT NULL, part_size BIGINT NOT NULL, status SMALLINT NOT NULL, error TEXT NOT NULL DEFAULT '', error_code SMALLINT NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL, "
    "updated_at_ms BIGINT NOT NULL, completed_at_ms BIGINT NOT NULL DEFAULT 0);",
    "CREATE TABLE IF NOT EXISTS operations (id TEXT PRIMARY KEY, type SMALLINT NOT NULL, source_id TEXT NOT NULL, source_category SMALLINT NOT "
    "NULL, source_path TEXT NOT NULL, dest_path TEXT NOT NULL, file_size BIGINT NOT NULL, bytes_processed BIGINT NOT NULL, status SMALLINT NOT "
    "NULL, error TEXT NOT NULL DEFAULT '', started_at_ms BIGINT NOT NULL, completed_at_ms BIGINT NOT NULL DEFAULT 0, seq BIGINT NOT NULL);",
    "CREATE INDEX IF NOT EXISTS operations_seq_idx ON operations(seq);",
    "CREATE TABLE IF NOT EXISTS file_tiers (source_id TEXT NOT NULL, path TEXT NOT NULL, tier SMALLINT NOT NULL, updated_at_ms BIGINT NOT "
    "NULL, PRIMARY KEY (source_id, path));",
    "CREATE TABLE IF NOT EXISTS tierbridge_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());",
};

} // namespace tierbridge::db::sql

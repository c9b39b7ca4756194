#pragma once

namespace tierbridge::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  Postgres installs the same statements as prepared statements with
  $n placeholders (see PgPool::PrepareStatements); column order must stay
  identical between the two.
*/

// transfers

static constexpr const char* INSERT_TRANSFER =
    "INSERT INTO transfers(id,kind,source_id,local_path,remote_path,total_size,bytes_transferred,part_index,total_parts,part_size,"
    "status,error,error_code,created_at_ms,updated_at_ms,completed_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_TRANSFER =
    "SELECT id,kind,source_id,local_path,remote_path,total_size,bytes_transferred,part_index,total_parts,part_size,"
    "status,error,error_code,created_at_ms,updated_at_ms,completed_at_ms"
    " FROM transfers WHERE id=?;";

static constexpr const char* LIST_TRANSFERS =
    "SELECT id,kind,source_id,local_path,remote_path,total_size,bytes_transferred,part_index,total_parts,part_size,"
    "status,error,error_code,created_at_ms,updated_at_ms,completed_at_ms"
    " FROM transfers ORDER BY created_at_ms ASC, id ASC;";

static constexpr const char* UPDATE_TRANSFER =
    "UPDATE transfers SET kind=?,source_id=?,local_path=?,remote_path=?,total_size=?,bytes_transferred=?,part_index=?,"
    "total_parts=?,part_size=?,status=?,error=?,error_code=?,created_at_ms=?,updated_at_ms=?,completed_at_ms=?"
    " WHERE id=?;";

static constexpr const char* DELETE_TRANSFER =
    "DELETE FROM transfers WHERE id=?;";

// operations

static constexpr const char* INSERT_OPERATION =
    "INSERT INTO operations(id,type,source_id,source_category,source_path,dest_path,file_size,bytes_processed,"
    "status,error,started_at_ms,completed_at_ms,seq)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_OPERATION =
    "SELECT id,type,source_id,source_category,source_path,dest_path,file_size,bytes_processed,"
    "status,error,started_at_ms,completed_at_ms,seq"
    " FROM operations WHERE id=?;";

static constexpr const char* LIST_OPERATIONS =
    "SELECT id,type,source_id,source_category,source_path,dest_path,file_size,bytes_processed,"
    "status,error,started_at_ms,completed_at_ms,seq"
    " FROM operations ORDER BY seq ASC;";

static constexpr const char* UPDATE_OPERATION =
    "UPDATE operations SET type=?,source_id=?,source_category=?,source_path=?,dest_path=?,file_size=?,bytes_processed=?,"
    "status=?,error=?,started_at_ms=?,completed_at_ms=?,seq=?"
    " WHERE id=?;";

static constexpr const char* DELETE_OPERATION =
    "DELETE FROM operations WHERE id=?;";

// file tiers

static constexpr const char* UPSERT_FILE_TIER =
    "INSERT INTO file_tiers(source_id,path,tier,updated_at_ms)"
    " VALUES(?,?,?,?)"
    " ON CONFLICT(source_id,path) DO UPDATE SET"
    " tier=excluded.tier,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_FILE_TIER =
    "SELECT source_id,path,tier,updated_at_ms"
    " FROM file_tiers WHERE source_id=? AND path=?;";

static constexpr const char* DELETE_FILE_TIER =
    "DELETE FROM file_tiers WHERE source_id=? AND path=?;";

static constexpr const char* LIST_FILE_TIERS =
    "SELECT source_id,path,tier,updated_at_ms"
    " FROM file_tiers WHERE source_id=? ORDER BY path ASC;";

} // namespace tierbridge::db::sql

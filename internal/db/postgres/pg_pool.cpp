#include "pg_pool.hpp"

namespace tierbridge::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_transfer",
               "INSERT INTO transfers(id,kind,source_id,local_path,remote_path,total_size,bytes_transferred,part_index,total_parts,part_size,"
               "status,error,error_code,created_at_ms,updated_at_ms,completed_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16)");

  conn.prepare("get_transfer",
               "SELECT id,kind,source_id,local_path,remote_path,total_size,bytes_transferred,part_index,total_parts,part_size,"
               "status,error,error_code,created_at_ms,updated_at_ms,completed_at_ms "
               "FROM transfers WHERE id=$1");

  conn.prepare("list_transfers",
               "SELECT id,kind,source_id,local_path,remote_path,total_size,bytes_transferred,part_index,total_parts,part_size,"
               "status,error,error_code,created_at_ms,updated_at_ms,completed_at_ms "
               "FROM transfers ORDER BY created_at_ms ASC, id ASC");

  conn.prepare("update_transfer",
               "UPDATE transfers SET kind=$2,source_id=$3,local_path=$4,remote_path=$5,total_size=$6,bytes_transferred=$7,part_index=$8,"
               "total_parts=$9,part_size=$10,status=$11,error=$12,error_code=$13,created_at_ms=$14,updated_at_ms=$15,completed_at_ms=$16 "
               "WHERE id=$1");

  conn.prepare("delete_transfer", "DELETE FROM transfers WHERE id=$1");

  conn.prepare("insert_operation",
               "INSERT INTO operations(id,type,source_id,source_category,source_path,dest_path,file_size,bytes_processed,"
               "status,error,started_at_ms,completed_at_ms,seq) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13)");

  conn.prepare("get_operation",
               "SELECT id,type,source_id,source_category,source_path,dest_path,file_size,bytes_processed,"
               "status,error,started_at_ms,completed_at_ms,seq "
               "FROM operations WHERE id=$1");

  conn.prepare("list_operations",
               "SELECT id,type,source_id,source_category,source_path,dest_path,file_size,bytes_processed,"
               "status,error,started_at_ms,completed_at_ms,seq "
               "FROM operations ORDER BY seq ASC");

  conn.prepare("update_operation",
               "UPDATE operations SET type=$2,source_id=$3,source_category=$4,source_path=$5,dest_path=$6,file_size=$7,bytes_processed=$8,"
               "status=$9,error=$10,started_at_ms=$11,completed_at_ms=$12,seq=$13 "
               "WHERE id=$1");

  conn.prepare("delete_operation", "DELETE FROM operations WHERE id=$1");

  conn.prepare("upsert_file_tier",
               "INSERT INTO file_tiers(source_id,path,tier,updated_at_ms) VALUES($1,$2,$3,$4) "
               "ON CONFLICT(source_id,path) DO UPDATE SET tier=EXCLUDED.tier,updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("get_file_tier", "SELECT source_id,path,tier,updated_at_ms FROM file_tiers WHERE source_id=$1 AND path=$2");

  conn.prepare("delete_file_tier", "DELETE FROM file_tiers WHERE source_id=$1 AND path=$2");

  conn.prepare("list_file_tiers", "SELECT source_id,path,tier,updated_at_ms FROM file_tiers WHERE source_id=$1 ORDER BY path ASC");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace tierbridge::db::postgres

#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace tierbridge::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      TIERBRIDGE_LOG_WARN("postgres rollback failed", {observability::ErrorField(e)});
    }
  }
  // work must be destroyed before its connection goes back to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  finished_ = true;
}

} // namespace tierbridge::db::postgres

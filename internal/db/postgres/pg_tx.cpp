#include "pg_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace chronicle::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try { tx_->abort(); }
    catch (const std::exception& e) {
      CHRONICLE_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // the work must go before its connection returns to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  if (finished_) throw std::logic_error("postgres transaction already finished");
  finished_ = true;
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

}

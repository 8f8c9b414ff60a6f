#include "pg_pool.hpp"

namespace chronicle::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->is_open()) return Wrap(conn.release());
      // dropped by the server while idle; replace it
      --live_connections_;
      continue;
    }

    if (live_connections_ < max_connections_) {
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

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_stream",
               "SELECT id, aggregate_type, version, created_at_ms, updated_at_ms "
               "FROM chronicle_streams WHERE id=$1");

  conn.prepare("lock_stream",
               "SELECT id, aggregate_type, version, created_at_ms, updated_at_ms "
               "FROM chronicle_streams WHERE id=$1 FOR UPDATE");

  conn.prepare("update_stream_version",
               "UPDATE chronicle_streams SET version=$3, updated_at_ms=$4 WHERE id=$1 AND version=$2");

  conn.prepare("insert_event",
               "INSERT INTO chronicle_events(stream_id,version,type,data,recorded_at_ms) "
               "VALUES($1,$2,$3,$4::jsonb,$5) RETURNING seq_id");

  conn.prepare("get_document",
               "SELECT type, id, data::text, version_token, updated_at_ms "
               "FROM chronicle_documents WHERE type=$1 AND id=$2");

  conn.prepare("lock_document_key", "SELECT pg_advisory_xact_lock(hashtextextended($1 || '/' || $2, 0))");

  conn.prepare("lock_document",
               "SELECT type, id, data::text, version_token, updated_at_ms "
               "FROM chronicle_documents WHERE type=$1 AND id=$2 FOR UPDATE");

  conn.prepare("upsert_document",
               "INSERT INTO chronicle_documents(type,id,data,version_token,updated_at_ms) VALUES($1,$2,$3::jsonb,$4,$5) "
               "ON CONFLICT(type,id) DO UPDATE SET data=EXCLUDED.data, version_token=EXCLUDED.version_token, "
               "updated_at_ms=EXCLUDED.updated_at_ms");
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

} // namespace chronicle::db::postgres

#include "pg_pool.hpp"

namespace freightline::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
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
  } catch (...) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_token",
               "INSERT INTO tokens(id,token_type,version,state,payload,root_shipment_id,signature,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5::jsonb,$6,$7,$8,$9)");

  conn.prepare("get_token",
               "SELECT id,token_type,version,state,payload::text,root_shipment_id,signature,created_at_ms,updated_at_ms "
               "FROM tokens WHERE id=$1");

  conn.prepare("update_token_state", "UPDATE tokens SET state=$2,signature=$3,updated_at_ms=$4 WHERE id=$1");

  conn.prepare("list_tokens_by_shipment",
               "SELECT id,token_type,version,state,payload::text,root_shipment_id,signature,created_at_ms,updated_at_ms "
               "FROM tokens WHERE root_shipment_id=$1 ORDER BY created_at_ms ASC, seq ASC");

  conn.prepare("list_tokens",
               "SELECT id,token_type,version,state,payload::text,root_shipment_id,signature,created_at_ms,updated_at_ms "
               "FROM tokens ORDER BY created_at_ms ASC, seq ASC");
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
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      --live_connections_;
      delete conn;
    }
  }
  cv_.notify_one();
}

} // namespace freightline::db::postgres

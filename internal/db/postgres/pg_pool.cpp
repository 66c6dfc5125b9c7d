#include "pg_pool.hpp"

namespace registry::db::postgres {

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

// Hot-path lookups used by every registration attempt.
void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_name",
               "SELECT name,address,address_type,owner,season_id,created_at,updated_at "
               "FROM name_records WHERE name=$1");

  conn.prepare("get_name_by_owner",
               "SELECT name,address,address_type,owner,season_id,created_at,updated_at "
               "FROM name_records WHERE owner=$1");

  conn.prepare("get_season",
               "SELECT id,name,start_time,end_time,max_names,min_name_length,max_name_length,price,status,created_at,updated_at "
               "FROM seasons WHERE id=$1");

  conn.prepare("is_block_consumed", "SELECT 1 FROM consumed_blocks WHERE block_index=$1");

  conn.prepare("count_names_in_season", "SELECT COUNT(*) FROM name_records WHERE season_id=$1");

  conn.prepare("get_role", "SELECT principal,role FROM roles WHERE principal=$1");
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

} // namespace registry::db::postgres

#include "pg_pool.hpp"

namespace slideshow::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
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
}

void PgPool::Bootstrap(const std::vector<std::string>& statements) {
  // plain connection: pooled ones prepare statements against the tables
  pqxx::connection conn(conninfo_);
  pqxx::work       work(conn);
  for (const auto& statement : statements) {
    work.exec(statement);
  }
  work.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_project",
               "SELECT id,name,status,output_path,duration_per_image,fps,created_at_ms,updated_at_ms "
               "FROM video_projects WHERE id=$1");

  conn.prepare("insert_project",
               "INSERT INTO video_projects(name,status,output_path,duration_per_image,fps,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7) RETURNING id");

  conn.prepare("set_project_status",
               "UPDATE video_projects SET status=$2,output_path=COALESCE($3,output_path),updated_at_ms=$4 WHERE id=$1");

  conn.prepare("insert_image",
               "INSERT INTO images(project_id,filename,file_path,file_size,mime_type,order_index,uploaded_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7) RETURNING id");

  conn.prepare("list_images_ordered",
               "SELECT id,project_id,filename,file_path,file_size,mime_type,order_index,uploaded_at_ms "
               "FROM images WHERE project_id=$1 ORDER BY order_index ASC, id ASC");
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

} // namespace slideshow::db::postgres

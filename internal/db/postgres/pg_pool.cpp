#include "pg_pool.hpp"

namespace apparatus::db::postgres {

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
          auto* conn = new pqxx::connection(conninfo_);
          try {
            PrepareStatements(*conn);
          } catch (const std::exception&) {
            delete conn;
            throw;
          }
          return Wrap(conn);
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
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_unit",
               "SELECT id, verse_id, position, classification, significance, reason_code, reason_summary, version, created_at_ms "
               "FROM variant_units WHERE verse_id=$1 AND position=$2");

  conn.prepare("get_unit_by_id",
               "SELECT id, verse_id, position, classification, significance, reason_code, reason_summary, version, created_at_ms "
               "FROM variant_units WHERE id=$1");

  conn.prepare("insert_unit",
               "INSERT INTO variant_units(verse_id,position,classification,significance,reason_code,reason_summary,version,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8) RETURNING id");

  conn.prepare("claim_unit", "UPDATE variant_units SET version=version+1 WHERE id=$1 AND version=$2");

  conn.prepare("update_unit_classification",
               "UPDATE variant_units SET classification=$2,significance=$3,reason_code=$4,reason_summary=$5 WHERE id=$1");

  conn.prepare("delete_unit", "DELETE FROM variant_units WHERE id=$1");

  conn.prepare("insert_reading",
               "INSERT INTO readings(unit_id,reading_index,surface_text,canonical_key,is_spine,classification,significance,reason_code,"
               "reason_summary) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) RETURNING id");

  conn.prepare("list_readings",
               "SELECT id,unit_id,reading_index,surface_text,canonical_key,is_spine,classification,significance,reason_code,reason_summary "
               "FROM readings WHERE unit_id=$1 ORDER BY reading_index");

  conn.prepare("has_support",
               "SELECT 1 FROM witness_supports WHERE reading_id=$1 AND witness_siglum=$2 AND source_pack_id=$3 LIMIT 1");

  conn.prepare("insert_support",
               "INSERT INTO witness_supports(reading_id,witness_siglum,witness_type,raw_type_label,source_pack_id,century_earliest,"
               "century_latest) VALUES($1,$2,$3,$4,$5,$6,$7) RETURNING id");

  conn.prepare("list_supports",
               "SELECT id,reading_id,witness_siglum,witness_type,raw_type_label,source_pack_id,century_earliest,century_latest "
               "FROM witness_supports WHERE reading_id=$1 ORDER BY id");
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

} // namespace apparatus::db::postgres

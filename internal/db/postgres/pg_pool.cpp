#include "pg_pool.hpp"

namespace tablebook::db::postgres {

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

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("upsert_restaurant",
               "INSERT INTO restaurants(id,name,definition_json,updated_at_ms) VALUES($1,$2,$3::jsonb,$4) "
               "ON CONFLICT(id) DO UPDATE SET name=EXCLUDED.name,definition_json=EXCLUDED.definition_json,"
               "updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("get_restaurant",
               "SELECT id,name,definition_json::text,updated_at_ms FROM restaurants WHERE id=$1");

  conn.prepare("upsert_table",
               "INSERT INTO restaurant_tables(id,restaurant_id,number,min_capacity,max_capacity,combinable,active,priority,"
               "section,adjacent_table_ids) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) "
               "ON CONFLICT(id) DO UPDATE SET restaurant_id=EXCLUDED.restaurant_id,number=EXCLUDED.number,"
               "min_capacity=EXCLUDED.min_capacity,max_capacity=EXCLUDED.max_capacity,combinable=EXCLUDED.combinable,"
               "active=EXCLUDED.active,priority=EXCLUDED.priority,section=EXCLUDED.section,"
               "adjacent_table_ids=EXCLUDED.adjacent_table_ids");

  conn.prepare("deactivate_table", "UPDATE restaurant_tables SET active=false WHERE id=$1");

  conn.prepare("list_tables",
               "SELECT id,restaurant_id,number,min_capacity,max_capacity,combinable,active,priority,section,adjacent_table_ids "
               "FROM restaurant_tables WHERE restaurant_id=$1 ORDER BY id");

  conn.prepare("upsert_turn_time_rule",
               "INSERT INTO turn_time_rules(id,restaurant_id,name,min_party_size,max_party_size,duration_minutes,priority,active) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8) "
               "ON CONFLICT(id) DO UPDATE SET restaurant_id=EXCLUDED.restaurant_id,name=EXCLUDED.name,"
               "min_party_size=EXCLUDED.min_party_size,max_party_size=EXCLUDED.max_party_size,"
               "duration_minutes=EXCLUDED.duration_minutes,priority=EXCLUDED.priority,active=EXCLUDED.active");

  conn.prepare("list_turn_time_rules",
               "SELECT id,restaurant_id,name,min_party_size,max_party_size,duration_minutes,priority,active "
               "FROM turn_time_rules WHERE restaurant_id=$1 ORDER BY id");

  conn.prepare("insert_booking",
               "INSERT INTO bookings(id,restaurant_id,date,start_minute,duration_minutes,party_size,status,source,"
               "customer_name,customer_email,customer_phone,notes,pacing_overridden,override_reason,created_by,"
               "confirmation_code,created_at_ms,updated_at_ms,version) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19)");

  conn.prepare("update_booking",
               "UPDATE bookings SET date=$2,start_minute=$3,duration_minutes=$4,party_size=$5,status=$6,source=$7,"
               "customer_name=$8,customer_email=$9,customer_phone=$10,notes=$11,pacing_overridden=$12,"
               "override_reason=$13,updated_at_ms=$14,version=$15 WHERE id=$1 AND version=$16");

  conn.prepare("booking_exists", "SELECT 1 FROM bookings WHERE id=$1");

  conn.prepare("get_booking",
               "SELECT id,restaurant_id,date,start_minute,duration_minutes,party_size,status,source,"
               "customer_name,customer_email,customer_phone,notes,pacing_overridden,override_reason,created_by,"
               "confirmation_code,created_at_ms,updated_at_ms,version FROM bookings WHERE id=$1");

  conn.prepare("list_bookings",
               "SELECT id,restaurant_id,date,start_minute,duration_minutes,party_size,status,source,"
               "customer_name,customer_email,customer_phone,notes,pacing_overridden,override_reason,created_by,"
               "confirmation_code,created_at_ms,updated_at_ms,version FROM bookings "
               "WHERE restaurant_id=$1 AND date=$2 ORDER BY start_minute,id");

  conn.prepare("insert_booking_table",
               "INSERT INTO booking_tables(booking_id,table_id,position,date,start_minute,end_minute,active) "
               "VALUES($1,$2,$3,$4,$5,$6,$7)");

  conn.prepare("delete_booking_tables", "DELETE FROM booking_tables WHERE booking_id=$1");

  conn.prepare("list_booking_tables", "SELECT table_id FROM booking_tables WHERE booking_id=$1 ORDER BY position");
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

} // namespace tablebook::db::postgres

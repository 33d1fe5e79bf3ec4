#include "schema.hpp"

namespace tablebook::db::sql {

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS restaurants (id TEXT PRIMARY KEY, name TEXT NOT NULL, definition_json TEXT NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS restaurant_tables (id TEXT PRIMARY KEY, restaurant_id TEXT NOT NULL REFERENCES restaurants(id), number TEXT NOT NULL, "
      "min_capacity INTEGER NOT NULL, max_capacity INTEGER NOT NULL, combinable INTEGER NOT NULL, active INTEGER NOT NULL, priority INTEGER NOT NULL, "
      "section TEXT NOT NULL DEFAULT '', adjacent_table_ids TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS idx_restaurant_tables_restaurant ON restaurant_tables(restaurant_id);",
      "CREATE TABLE IF NOT EXISTS turn_time_rules (id TEXT PRIMARY KEY, restaurant_id TEXT NOT NULL REFERENCES restaurants(id), name TEXT NOT NULL, "
      "min_party_size INTEGER NOT NULL, max_party_size INTEGER NOT NULL, duration_minutes INTEGER NOT NULL, priority INTEGER NOT NULL, active INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS bookings (id TEXT PRIMARY KEY, restaurant_id TEXT NOT NULL REFERENCES restaurants(id), date TEXT NOT NULL, "
      "start_minute INTEGER NOT NULL, duration_minutes INTEGER NOT NULL, party_size INTEGER NOT NULL, status INTEGER NOT NULL, source INTEGER NOT NULL, "
      "customer_name TEXT NOT NULL DEFAULT '', customer_email TEXT NOT NULL DEFAULT '', customer_phone TEXT NOT NULL DEFAULT '', notes TEXT NOT NULL DEFAULT '', "
      "pacing_overridden INTEGER NOT NULL, override_reason TEXT NOT NULL DEFAULT '', created_by TEXT NOT NULL DEFAULT '', confirmation_code TEXT NOT NULL DEFAULT '', "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, version INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_bookings_restaurant_date ON bookings(restaurant_id, date);",
      "CREATE TABLE IF NOT EXISTS booking_tables (booking_id TEXT NOT NULL REFERENCES bookings(id), table_id TEXT NOT NULL REFERENCES restaurant_tables(id), "
      "position INTEGER NOT NULL, date TEXT NOT NULL, start_minute INTEGER NOT NULL, end_minute INTEGER NOT NULL, active INTEGER NOT NULL, "
      "PRIMARY KEY (booking_id, table_id));",
      "CREATE INDEX IF NOT EXISTS idx_booking_tables_table_date ON booking_tables(table_id, date);",
      "CREATE TRIGGER IF NOT EXISTS booking_tables_no_overlap BEFORE INSERT ON booking_tables WHEN NEW.active = 1 "
      "BEGIN SELECT RAISE(ABORT, 'table already claimed for an overlapping interval') WHERE EXISTS ("
      "SELECT 1 FROM booking_tables bt WHERE bt.table_id = NEW.table_id AND bt.date = NEW.date AND bt.active = 1 "
      "AND bt.booking_id <> NEW.booking_id AND bt.start_minute < NEW.end_minute AND NEW.start_minute < bt.end_minute); END;",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE EXTENSION IF NOT EXISTS btree_gist;",
      "CREATE TABLE IF NOT EXISTS restaurants (id TEXT PRIMARY KEY, name TEXT NOT NULL, definition_json JSONB NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS restaurant_tables (id TEXT PRIMARY KEY, restaurant_id TEXT NOT NULL REFERENCES restaurants(id), number TEXT NOT NULL, "
      "min_capacity INTEGER NOT NULL, max_capacity INTEGER NOT NULL, combinable BOOLEAN NOT NULL, active BOOLEAN NOT NULL, priority INTEGER NOT NULL, "
      "section TEXT NOT NULL DEFAULT '', adjacent_table_ids TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS idx_restaurant_tables_restaurant ON restaurant_tables(restaurant_id);",
      "CREATE TABLE IF NOT EXISTS turn_time_rules (id TEXT PRIMARY KEY, restaurant_id TEXT NOT NULL REFERENCES restaurants(id), name TEXT NOT NULL, "
      "min_party_size INTEGER NOT NULL, max_party_size INTEGER NOT NULL, duration_minutes INTEGER NOT NULL, priority INTEGER NOT NULL, active BOOLEAN NOT NULL);",
      "CREATE TABLE IF NOT EXISTS bookings (id TEXT PRIMARY KEY, restaurant_id TEXT NOT NULL REFERENCES restaurants(id), date TEXT NOT NULL, "
      "start_minute INTEGER NOT NULL, duration_minutes INTEGER NOT NULL, party_size INTEGER NOT NULL, status SMALLINT NOT NULL, source SMALLINT NOT NULL, "
      "customer_name TEXT NOT NULL DEFAULT '', customer_email TEXT NOT NULL DEFAULT '', customer_phone TEXT NOT NULL DEFAULT '', notes TEXT NOT NULL DEFAULT '', "
      "pacing_overridden BOOLEAN NOT NULL, override_reason TEXT NOT NULL DEFAULT '', created_by TEXT NOT NULL DEFAULT '', confirmation_code TEXT NOT NULL DEFAULT '', "
      "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, version BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_bookings_restaurant_date ON bookings(restaurant_id, date);",
      "CREATE TABLE IF NOT EXISTS booking_tables (booking_id TEXT NOT NULL REFERENCES bookings(id), table_id TEXT NOT NULL REFERENCES restaurant_tables(id), "
      "position INTEGER NOT NULL, date TEXT NOT NULL, start_minute INTEGER NOT NULL, end_minute INTEGER NOT NULL, active BOOLEAN NOT NULL, "
      "PRIMARY KEY (booking_id, table_id));",
      "DO $$ BEGIN "
      "ALTER TABLE booking_tables ADD CONSTRAINT booking_tables_no_overlap EXCLUDE USING gist "
      "(table_id WITH =, date WITH =, int4range(start_minute, end_minute) WITH &&) WHERE (active); "
      "EXCEPTION WHEN duplicate_object OR duplicate_table THEN NULL; END $$;",
  };
  return kSchema;
}

} // namespace tablebook::db::sql

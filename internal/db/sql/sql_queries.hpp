#pragma once

namespace tablebook::db::sql {

/*
  SQL used by the SQLite backend.

  Column order here is the order the row readers expect. The PostgreSQL
  backend prepares the same statements with $n placeholders.
*/

// restaurants

static constexpr const char* UPSERT_RESTAURANT =
    "INSERT INTO restaurants(id,name,definition_json,updated_at_ms) VALUES(?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " name=excluded.name,"
    " definition_json=excluded.definition_json,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_RESTAURANT =
    "SELECT id,name,definition_json,updated_at_ms FROM restaurants WHERE id=?;";

// tables

static constexpr const char* UPSERT_TABLE =
    "INSERT INTO restaurant_tables(id,restaurant_id,number,min_capacity,max_capacity,combinable,active,priority,section,adjacent_table_ids)"
    " VALUES(?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " restaurant_id=excluded.restaurant_id,"
    " number=excluded.number,"
    " min_capacity=excluded.min_capacity,"
    " max_capacity=excluded.max_capacity,"
    " combinable=excluded.combinable,"
    " active=excluded.active,"
    " priority=excluded.priority,"
    " section=excluded.section,"
    " adjacent_table_ids=excluded.adjacent_table_ids;";

static constexpr const char* DEACTIVATE_TABLE =
    "UPDATE restaurant_tables SET active=0 WHERE id=?;";

static constexpr const char* SELECT_TABLES =
    "SELECT id,restaurant_id,number,min_capacity,max_capacity,combinable,active,priority,section,adjacent_table_ids"
    " FROM restaurant_tables WHERE restaurant_id=? ORDER BY id;";

// turn-time rules

static constexpr const char* UPSERT_TURN_TIME_RULE =
    "INSERT INTO turn_time_rules(id,restaurant_id,name,min_party_size,max_party_size,duration_minutes,priority,active)"
    " VALUES(?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " restaurant_id=excluded.restaurant_id,"
    " name=excluded.name,"
    " min_party_size=excluded.min_party_size,"
    " max_party_size=excluded.max_party_size,"
    " duration_minutes=excluded.duration_minutes,"
    " priority=excluded.priority,"
    " active=excluded.active;";

static constexpr const char* SELECT_TURN_TIME_RULES =
    "SELECT id,restaurant_id,name,min_party_size,max_party_size,duration_minutes,priority,active"
    " FROM turn_time_rules WHERE restaurant_id=? ORDER BY id;";

// bookings

static constexpr const char* INSERT_BOOKING =
    "INSERT INTO bookings(id,restaurant_id,date,start_minute,duration_minutes,party_size,status,source,"
    "customer_name,customer_email,customer_phone,notes,pacing_overridden,override_reason,created_by,"
    "confirmation_code,created_at_ms,updated_at_ms,version)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_BOOKING =
    "UPDATE bookings SET date=?,start_minute=?,duration_minutes=?,party_size=?,status=?,source=?,"
    "customer_name=?,customer_email=?,customer_phone=?,notes=?,pacing_overridden=?,override_reason=?,"
    "updated_at_ms=?,version=?"
    " WHERE id=? AND version=?;";

static constexpr const char* BOOKING_EXISTS =
    "SELECT 1 FROM bookings WHERE id=?;";

static constexpr const char* SELECT_BOOKING =
    "SELECT id,restaurant_id,date,start_minute,duration_minutes,party_size,status,source,"
    "customer_name,customer_email,customer_phone,notes,pacing_overridden,override_reason,created_by,"
    "confirmation_code,created_at_ms,updated_at_ms,version"
    " FROM bookings WHERE id=?;";

static constexpr const char* SELECT_BOOKINGS_FOR_DATE =
    "SELECT id,restaurant_id,date,start_minute,duration_minutes,party_size,status,source,"
    "customer_name,customer_email,customer_phone,notes,pacing_overridden,override_reason,created_by,"
    "confirmation_code,created_at_ms,updated_at_ms,version"
    " FROM bookings WHERE restaurant_id=? AND date=? ORDER BY start_minute,id;";

// table claims

static constexpr const char* INSERT_BOOKING_TABLE =
    "INSERT INTO booking_tables(booking_id,table_id,position,date,start_minute,end_minute,active)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* DELETE_BOOKING_TABLES =
    "DELETE FROM booking_tables WHERE booking_id=?;";

static constexpr const char* SELECT_BOOKING_TABLES =
    "SELECT table_id FROM booking_tables WHERE booking_id=? ORDER BY position;";

} // namespace tablebook::db::sql

#pragma once

#include <string>
#include <vector>

namespace tablebook::db::sql {

/*
  Bootstrap DDL, applied idempotently at startup.

  Both dialects carry the storage-level double-booking guard on
  booking_tables:
    SQLite:   BEFORE INSERT trigger raising ABORT (SQLITE_CONSTRAINT)
    Postgres: btree_gist exclusion constraint (SQLSTATE 23P01)
*/

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace tablebook::db::sql

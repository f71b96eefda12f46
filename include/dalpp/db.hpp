// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp -- umbrella header.
//
// Design:
//   - Users include this single header and use dalpp::Db (SQLite3)
//   - To switch backend: using MyDb = dalpp::Database<dalpp::MariaBackend>;
//   - Queries are engine-neutral and selected per connection at prepare time
//
// Usage (SQLite3, default):
//   #include "dalpp/db.hpp"
//   dalpp::Db db;
//   db.Open(":memory:");
//   auto tx = db.Transact(&err);
//
// Usage (MariaDB/MySQL, requires DALPP_HAS_MARIADB=1):
//   #include "dalpp/db.hpp"
//   dalpp::MDb db;
//   db.Open("localhost:3306:root:pass:testdb");

#pragma once

#include "dalpp/database.hpp"
#include "dalpp/error.hpp"
#include "dalpp/query.hpp"
#include "dalpp/sqlite3_backend.hpp"

#if defined(DALPP_HAS_MARIADB) && DALPP_HAS_MARIADB
#include "dalpp/maria_backend.hpp"
#endif

namespace dalpp {

// ---------------------------------------------------------------------------
// Convenience aliases
// ---------------------------------------------------------------------------

/// SQLite3 (always available)
using Db   = Database<Sqlite3Backend>;
using Tx   = Transaction<Sqlite3Backend>;
using Stmt = Statement<Sqlite3Backend>;
using Cur  = Cursor<Sqlite3Backend>;

#if defined(DALPP_HAS_MARIADB) && DALPP_HAS_MARIADB
/// MariaDB/MySQL (requires DALPP_HAS_MARIADB=1)
using MDb   = Database<MariaBackend>;
using MTx   = Transaction<MariaBackend>;
using MStmt = Statement<MariaBackend>;
using MCur  = Cursor<MariaBackend>;
#endif

}  // namespace dalpp

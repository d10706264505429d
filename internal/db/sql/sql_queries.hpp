#pragma once

namespace freightline::db::sql {

/*
  Canonical SQL.

  SQLite uses ? placeholders; the Postgres statements are prepared per
  connection in PgPool with $n placeholders and the same column order.
*/

static constexpr const char* kSqliteSchema =
    "CREATE TABLE IF NOT EXISTS tokens("
    " id TEXT PRIMARY KEY,"
    " token_type TEXT NOT NULL,"
    " version INTEGER NOT NULL,"
    " state TEXT NOT NULL,"
    " payload TEXT NOT NULL,"
    " root_shipment_id TEXT NOT NULL,"
    " signature TEXT,"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL);"
    "CREATE INDEX IF NOT EXISTS tokens_root_idx ON tokens(root_shipment_id);";

static constexpr const char* kPostgresSchema =
    "CREATE TABLE IF NOT EXISTS tokens("
    " seq BIGSERIAL,"
    " id TEXT PRIMARY KEY,"
    " token_type TEXT NOT NULL,"
    " version INTEGER NOT NULL,"
    " state TEXT NOT NULL,"
    " payload JSONB NOT NULL,"
    " root_shipment_id TEXT NOT NULL,"
    " signature TEXT,"
    " created_at_ms BIGINT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL);"
    "CREATE INDEX IF NOT EXISTS tokens_root_idx ON tokens(root_shipment_id);";

static constexpr const char* kInsertToken =
    "INSERT INTO tokens(id,token_type,version,state,payload,root_shipment_id,signature,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* kSelectToken =
    "SELECT id,token_type,version,state,payload,root_shipment_id,signature,created_at_ms,updated_at_ms"
    " FROM tokens WHERE id=?;";

static constexpr const char* kUpdateTokenState =
    "UPDATE tokens SET state=?,signature=?,updated_at_ms=? WHERE id=?;";

static constexpr const char* kSelectTokensByShipment =
    "SELECT id,token_type,version,state,payload,root_shipment_id,signature,created_at_ms,updated_at_ms"
    " FROM tokens WHERE root_shipment_id=? ORDER BY created_at_ms ASC, rowid ASC;";

static constexpr const char* kSelectAllTokens =
    "SELECT id,token_type,version,state,payload,root_shipment_id,signature,created_at_ms,updated_at_ms"
    " FROM tokens ORDER BY created_at_ms ASC, rowid ASC;";

} // namespace freightline::db::sql

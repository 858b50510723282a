#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace blockforge::db::sqlite {

namespace {
constexpr int kSchemaVersion = 1;
}

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS blocks (id INTEGER PRIMARY KEY AUTOINCREMENT, user_prompt TEXT NOT NULL, title TEXT NOT NULL, current_version INTEGER NOT NULL, refresh_interval_sec INTEGER NOT NULL DEFAULT 3600, layout TEXT NOT NULL, status INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS block_versions (block_id INTEGER NOT NULL REFERENCES blocks(id), version INTEGER NOT NULL, backend_code TEXT NOT NULL, frontend_code TEXT NOT NULL, explanation TEXT, status INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, PRIMARY KEY (block_id, version));",
      "CREATE TABLE IF NOT EXISTS block_data (id INTEGER PRIMARY KEY AUTOINCREMENT, block_id INTEGER NOT NULL REFERENCES blocks(id), data TEXT NOT NULL, fetched_at_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS block_data_latest ON block_data (block_id, fetched_at_ms);",
      "CREATE TABLE IF NOT EXISTS execution_logs (id INTEGER PRIMARY KEY AUTOINCREMENT, block_id INTEGER NOT NULL REFERENCES blocks(id), version INTEGER NOT NULL, execution_type INTEGER NOT NULL, success INTEGER NOT NULL, error_message TEXT, duration_ms INTEGER, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS execution_logs_block ON execution_logs (block_id, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS blockforge_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
  db.Exec("INSERT OR IGNORE INTO blockforge_schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(kSchemaVersion) +
          ", CAST(strftime('%s','now') AS INTEGER) * 1000);");

  // fail fast on a file created by an incompatible build
  db.Exec("SELECT id,user_prompt,title,current_version,refresh_interval_sec,layout,status,created_at_ms,updated_at_ms FROM blocks LIMIT 1;");
  db.Exec("SELECT block_id,version,backend_code,frontend_code,explanation,status,created_at_ms FROM block_versions LIMIT 1;");
  db.Exec("SELECT id,block_id,data,fetched_at_ms,expires_at_ms FROM block_data LIMIT 1;");
  db.Exec("SELECT id,block_id,version,execution_type,success,error_message,duration_ms,created_at_ms FROM execution_logs LIMIT 1;");
}

} // namespace blockforge::db::sqlite

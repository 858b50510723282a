#include "pg_schema.hpp"

namespace blockforge::db::postgres {

void BootstrapSchema(const std::shared_ptr<PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec(
      "CREATE TABLE IF NOT EXISTS blocks (id BIGSERIAL PRIMARY KEY, user_prompt TEXT NOT NULL, title TEXT NOT NULL, current_version INTEGER NOT NULL, "
      "refresh_interval_sec INTEGER NOT NULL DEFAULT 3600, layout JSONB NOT NULL, status SMALLINT NOT NULL, created_at_ms BIGINT NOT NULL, "
      "updated_at_ms BIGINT NOT NULL);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS block_versions (block_id BIGINT NOT NULL REFERENCES blocks(id), version INTEGER NOT NULL, backend_code TEXT NOT NULL, "
      "frontend_code TEXT NOT NULL, explanation TEXT, status SMALLINT NOT NULL, created_at_ms BIGINT NOT NULL, PRIMARY KEY (block_id, version));");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS block_data (id BIGSERIAL PRIMARY KEY, block_id BIGINT NOT NULL REFERENCES blocks(id), data JSONB NOT NULL, "
      "fetched_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS block_data_latest ON block_data (block_id, fetched_at_ms);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS execution_logs (id BIGSERIAL PRIMARY KEY, block_id BIGINT NOT NULL REFERENCES blocks(id), version INTEGER NOT NULL, "
      "execution_type SMALLINT NOT NULL, success BOOLEAN NOT NULL, error_message TEXT, duration_ms BIGINT, created_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS execution_logs_block ON execution_logs (block_id, created_at_ms);");
  tx.exec("CREATE TABLE IF NOT EXISTS blockforge_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());");
  tx.exec("INSERT INTO blockforge_schema_migrations(version) VALUES (1) ON CONFLICT DO NOTHING;");
  tx.commit();
}

} // namespace blockforge::db::postgres

#include "migrations.hpp"

namespace settle::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS participants (id INTEGER PRIMARY KEY AUTOINCREMENT, external_id TEXT NOT NULL UNIQUE, name TEXT NOT NULL, role TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS usage_events (id INTEGER PRIMARY KEY AUTOINCREMENT, participant_id INTEGER NOT NULL REFERENCES participants(id), kind TEXT NOT NULL, quantity REAL NOT NULL, unit TEXT NOT NULL, timestamp_ms INTEGER NOT NULL, source TEXT NOT NULL DEFAULT '', price_per_unit REAL);",
      "CREATE INDEX IF NOT EXISTS idx_usage_events_window ON usage_events(timestamp_ms, id);",
      "CREATE TABLE IF NOT EXISTS policies (id INTEGER PRIMARY KEY AUTOINCREMENT, use_case TEXT NOT NULL, body_json TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS settlement_batches (id INTEGER PRIMARY KEY AUTOINCREMENT, use_case TEXT NOT NULL, start_ms INTEGER NOT NULL, end_ms INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, policy_id INTEGER NOT NULL REFERENCES policies(id), CHECK (start_ms < end_ms));",
      "CREATE INDEX IF NOT EXISTS idx_settlement_batches_use_case ON settlement_batches(use_case, start_ms);",
      "CREATE TABLE IF NOT EXISTS settlement_lines (id INTEGER PRIMARY KEY AUTOINCREMENT, batch_id INTEGER NOT NULL REFERENCES settlement_batches(id), participant_id INTEGER NOT NULL REFERENCES participants(id), amount_cents INTEGER NOT NULL, description TEXT NOT NULL, proof_hash TEXT NOT NULL, UNIQUE(batch_id, participant_id));",
      "CREATE INDEX IF NOT EXISTS idx_settlement_lines_batch ON settlement_lines(batch_id, id);",
      "CREATE TRIGGER IF NOT EXISTS settlement_batches_append_only BEFORE UPDATE ON settlement_batches BEGIN SELECT RAISE(ABORT, 'settlement batches are append-only'); END;",
      "CREATE TRIGGER IF NOT EXISTS settlement_batches_no_delete BEFORE DELETE ON settlement_batches BEGIN SELECT RAISE(ABORT, 'settlement batches are append-only'); END;",
      "CREATE TRIGGER IF NOT EXISTS settlement_lines_append_only BEFORE UPDATE ON settlement_lines BEGIN SELECT RAISE(ABORT, 'settlement lines are append-only'); END;",
      "CREATE TRIGGER IF NOT EXISTS settlement_lines_no_delete BEFORE DELETE ON settlement_lines BEGIN SELECT RAISE(ABORT, 'settlement lines are append-only'); END;",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS participants (id BIGSERIAL PRIMARY KEY, external_id TEXT NOT NULL UNIQUE, name TEXT NOT NULL, role TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS usage_events (id BIGSERIAL PRIMARY KEY, participant_id BIGINT NOT NULL REFERENCES participants(id), kind TEXT NOT NULL, quantity DOUBLE PRECISION NOT NULL, unit TEXT NOT NULL, timestamp_ms BIGINT NOT NULL, source TEXT NOT NULL DEFAULT '', price_per_unit DOUBLE PRECISION);",
      "CREATE INDEX IF NOT EXISTS idx_usage_events_window ON usage_events(timestamp_ms, id);",
      "CREATE TABLE IF NOT EXISTS policies (id BIGSERIAL PRIMARY KEY, use_case TEXT NOT NULL, body_json TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS settlement_batches (id BIGSERIAL PRIMARY KEY, use_case TEXT NOT NULL, start_ms BIGINT NOT NULL, end_ms BIGINT NOT NULL, created_at_ms BIGINT NOT NULL, policy_id BIGINT NOT NULL REFERENCES policies(id), CHECK (start_ms < end_ms));",
      "CREATE INDEX IF NOT EXISTS idx_settlement_batches_use_case ON settlement_batches(use_case, start_ms);",
      "CREATE TABLE IF NOT EXISTS settlement_lines (id BIGSERIAL PRIMARY KEY, batch_id BIGINT NOT NULL REFERENCES settlement_batches(id), participant_id BIGINT NOT NULL REFERENCES participants(id), amount_cents BIGINT NOT NULL, description TEXT NOT NULL, proof_hash TEXT NOT NULL, UNIQUE(batch_id, participant_id));",
      "CREATE INDEX IF NOT EXISTS idx_settlement_lines_batch ON settlement_lines(batch_id, id);",
      "CREATE OR REPLACE FUNCTION settle_reject_mutation() RETURNS trigger AS $$ BEGIN RAISE EXCEPTION '% is append-only', TG_TABLE_NAME; END; $$ LANGUAGE plpgsql;",
      "CREATE OR REPLACE TRIGGER settlement_batches_append_only BEFORE UPDATE OR DELETE ON settlement_batches FOR EACH ROW EXECUTE FUNCTION settle_reject_mutation();",
      "CREATE OR REPLACE TRIGGER settlement_lines_append_only BEFORE UPDATE OR DELETE ON settlement_lines FOR EACH ROW EXECUTE FUNCTION settle_reject_mutation();",
  };
  return kSchema;
}

} // namespace settle::db::sql

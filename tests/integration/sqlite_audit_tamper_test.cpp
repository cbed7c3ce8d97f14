#include <sqlite3.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/audit/audit_reader.hpp"
#include "internal/core/settlement_engine.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/policy/policy_loader.hpp"
#include "internal/util/errors.hpp"

namespace {

using settle::model::EventKind;
using settle::model::Role;
using settle::model::Unit;
using settle::util::FromUnixMillis;

constexpr std::int64_t kStartMs = 1'714'521'600'000; // 2024-05-01T00:00:00Z
constexpr std::int64_t kHourMs  = 3'600'000;

struct Fixture {
  std::string                                        path;
  std::shared_ptr<settle::db::sqlite::SqliteDB>         db;
  std::shared_ptr<settle::db::sqlite::SqliteRepository> repository;
};

Fixture Open(const std::string& name) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  Fixture    fixture;
  fixture.path = (std::filesystem::temp_directory_path() / ("settlement_engine_" + name + "_" + std::to_string(stamp) + ".db")).string();
  fixture.db   = std::make_shared<settle::db::sqlite::SqliteDB>(fixture.path);
  settle::db::sql::RunMigrations(*fixture.db, settle::db::sql::SqliteSchema());
  fixture.repository = std::make_shared<settle::db::sqlite::SqliteRepository>(fixture.db);
  return fixture;
}

void Close(Fixture& fixture) {
  fixture.repository.reset();
  fixture.db.reset();
  std::filesystem::remove(fixture.path);
  std::filesystem::remove(fixture.path + "-wal");
  std::filesystem::remove(fixture.path + "-shm");
}

settle::core::EventInput Input(const std::string& external_id, Role role, EventKind kind, double quantity, const std::string& source) {
  settle::core::EventInput input;
  input.participant_external_id = external_id;
  input.participant_role        = role;
  input.kind                    = kind;
  input.quantity                = quantity;
  input.unit                    = Unit::kKwh;
  input.timestamp               = FromUnixMillis(kStartMs + kHourMs);
  input.source                  = source;
  return input;
}

std::int64_t SettleCommunityDay(const std::shared_ptr<settle::db::Repository>& repository) {
  settle::core::SettlementEngine engine(repository);
  (void)engine.Ingest({Input("pros-1", Role::kProsumer, EventKind::kGeneration, 20.0, "local_pv"),
                       Input("cons-1", Role::kConsumer, EventKind::kConsumption, 12.0, "local_pv"),
                       Input("cons-2", Role::kConsumer, EventKind::kConsumption, 4.0, "grid")});

  settle::policy::RawPolicy raw;
  raw.use_case = "energy_community";
  const settle::model::TimeWindow day{FromUnixMillis(kStartMs), FromUnixMillis(kStartMs + 24 * kHourMs)};
  const auto                      outcome = engine.Execute(settle::policy::LoadPolicy(raw), day);
  assert(!outcome.lines.empty());
  return outcome.batch.id;
}

void TestCommittedBatchVerifiesAfterReopen() {
  auto       fixture  = Open("reopen");
  const auto batch_id = SettleCommunityDay(fixture.repository);
  const auto path     = fixture.path;

  fixture.repository.reset();
  fixture.db.reset();

  auto reopened = std::make_shared<settle::db::sqlite::SqliteDB>(path);
  settle::db::sql::RunMigrations(*reopened, settle::db::sql::SqliteSchema());
  auto repository = std::make_shared<settle::db::sqlite::SqliteRepository>(reopened);

  settle::audit::AuditReader reader(repository);
  const auto                 report = reader.Load(batch_id, true);
  assert(report.has_value());
  assert(report->verified_lines == report->lines.size());
  assert(report->total_amount == 0);

  fixture.db         = reopened;
  fixture.repository = repository;
  Close(fixture);
}

void TestLedgerRejectsUpdatesAndDeletes() {
  auto fixture = Open("append_only");
  (void)SettleCommunityDay(fixture.repository);

  assert(fixture.db->TryExec("UPDATE settlement_lines SET amount_cents = amount_cents + 1;") == SQLITE_CONSTRAINT);
  assert(fixture.db->TryExec("DELETE FROM settlement_lines;") == SQLITE_CONSTRAINT);
  assert(fixture.db->TryExec("UPDATE settlement_batches SET use_case = 'x';") == SQLITE_CONSTRAINT);
  assert(fixture.db->TryExec("DELETE FROM settlement_batches;") == SQLITE_CONSTRAINT);

  Close(fixture);
}

void TestTamperedLineFailsVerification() {
  auto       fixture  = Open("tamper");
  const auto batch_id = SettleCommunityDay(fixture.repository);

  // Someone with raw database access bypasses the append-only trigger.
  fixture.db->Exec("DROP TRIGGER settlement_lines_append_only;");
  fixture.db->Exec("UPDATE settlement_lines SET amount_cents = amount_cents + 1 WHERE id = (SELECT MIN(id) FROM settlement_lines);");

  settle::audit::AuditReader reader(fixture.repository);
  const auto                 report = reader.Load(batch_id, false);
  assert(report.has_value());
  assert(report->verified_lines + 1 == report->lines.size());
  assert(!report->lines.front().is_verified);
  for (std::size_t i = 1; i < report->lines.size(); ++i) {
    assert(report->lines[i].is_verified);
  }
  assert(report->total_amount == 1);

  Close(fixture);
}

void TestUnknownStoredRoleIsRejected() {
  auto fixture = Open("bad_role");
  (void)SettleCommunityDay(fixture.repository);

  fixture.db->Exec("UPDATE participants SET role = 'landowner' WHERE external_id = 'cons-1';");

  settle::core::SettlementEngine engine(fixture.repository);
  settle::policy::RawPolicy      raw;
  raw.use_case = "energy_community";
  const settle::model::TimeWindow next_day{FromUnixMillis(kStartMs + 24 * kHourMs), FromUnixMillis(kStartMs + 48 * kHourMs)};
  bool                            rejected = false;
  try {
    (void)engine.Preview(settle::policy::LoadPolicy(raw), next_day);
  } catch (const settle::util::ConsistencyError&) {
    rejected = true;
  }
  assert(rejected);

  Close(fixture);
}

} // namespace

int main() {
  TestCommittedBatchVerifiesAfterReopen();
  TestLedgerRejectsUpdatesAndDeletes();
  TestTamperedLineFailsVerification();
  TestUnknownStoredRoleIsRejected();

  std::cout << "settle_integration_sqlite_audit_tamper: pass\n";
  return 0;
}

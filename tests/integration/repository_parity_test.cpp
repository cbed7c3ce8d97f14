#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"

namespace {

using settle::db::ErrorCode;
using settle::db::Repository;
using settle::db::model::ParticipantRecord;
using settle::db::model::PolicyRecord;
using settle::db::model::SettlementBatchRecord;
using settle::db::model::SettlementLineRecord;
using settle::db::model::UsageEventRecord;
using settle::model::EventKind;
using settle::model::Role;
using settle::model::Unit;

constexpr std::int64_t kStartMs = 1'714'521'600'000; // 2024-05-01T00:00:00Z
constexpr std::int64_t kDayMs   = 86'400'000;

std::int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                  name;
  std::function<std::shared_ptr<Repository>()> make_repository;
  bool                                         durable = false;
  std::function<void()>                        cleanup;
};

std::int64_t InsertParticipant(Repository& repo, const std::string& external_id, Role role) {
  auto              tx = repo.Begin();
  ParticipantRecord record{.external_id = external_id, .name = external_id + " name", .role = role};
  const auto        inserted = repo.InsertParticipant(*tx, record);
  assert(inserted);
  assert(record.id > 0);
  tx->Commit();
  return record.id;
}

void VerifyParticipants(Repository& repo, const std::string& prefix) {
  const auto tenant   = InsertParticipant(repo, prefix + "-tenant", Role::kTenant);
  const auto landlord = InsertParticipant(repo, prefix + "-landlord", Role::kLandlord);
  assert(landlord > tenant);

  auto tx = repo.Begin();

  auto by_id = repo.GetParticipant(*tx, tenant);
  assert(by_id.has_value());
  assert(by_id->external_id == prefix + "-tenant");
  assert(by_id->name == prefix + "-tenant name");
  assert(by_id->role == Role::kTenant);

  auto by_external = repo.GetParticipantByExternalId(*tx, prefix + "-landlord");
  assert(by_external.has_value());
  assert(by_external->id == landlord);
  assert(by_external->role == Role::kLandlord);

  assert(!repo.GetParticipant(*tx, landlord + 1000).has_value());
  assert(!repo.GetParticipantByExternalId(*tx, prefix + "-nobody").has_value());

  ParticipantRecord duplicate{.external_id = prefix + "-tenant", .name = "again", .role = Role::kConsumer};
  const auto        result = repo.InsertParticipant(*tx, duplicate);
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);
  tx->Rollback();

  auto list_tx = repo.Begin();
  const auto all = repo.ListParticipants(*list_tx);
  for (std::size_t i = 1; i < all.size(); ++i) {
    assert(all[i - 1].id < all[i].id);
  }
  list_tx->Commit();
}

void VerifyEventWindow(Repository& repo, const std::string& prefix, std::int64_t day) {
  const auto participant = InsertParticipant(repo, prefix + "-meter", Role::kProsumer);
  const auto start       = kStartMs + day * kDayMs;
  const auto end         = start + kDayMs;

  {
    auto tx = repo.Begin();
    for (const auto offset : {end - start, std::int64_t{-1}, end - start - 1, std::int64_t{0}, std::int64_t{0}}) {
      UsageEventRecord event{.participant_id = participant,
                             .kind           = EventKind::kGeneration,
                             .quantity       = 1.25,
                             .unit           = Unit::kKwh,
                             .timestamp_ms   = start + offset,
                             .source         = "local_pv"};
      const auto inserted = repo.InsertEvent(*tx, event);
      assert(inserted);
    }

    UsageEventRecord priced{.participant_id = participant,
                            .kind           = EventKind::kConsumption,
                            .quantity       = 2.0,
                            .unit           = Unit::kEur,
                            .timestamp_ms   = start + 10,
                            .source         = "",
                            .price_per_unit = 0.0};
    const auto inserted = repo.InsertEvent(*tx, priced);
    assert(inserted);
    tx->Commit();
  }
  {
    // A failed statement aborts a Postgres transaction, so check each case in its own transaction.
    auto             tx = repo.Begin();
    UsageEventRecord orphan{.participant_id = participant + 100'000, .kind = EventKind::kConsumption, .quantity = 1.0, .unit = Unit::kKwh,
                            .timestamp_ms = start};
    assert(!repo.InsertEvent(*tx, orphan) && "Events must reference an existing participant.");
    tx->Rollback();
  }

  auto tx     = repo.Begin();
  auto events = repo.ListEventsInWindow(*tx, start, end);
  tx->Commit();

  // Two at start, one at start+10, one at end-1. end and start-1 are outside.
  assert(events.size() == 4);
  assert(events[0].timestamp_ms == start);
  assert(events[1].timestamp_ms == start);
  assert(events[0].id < events[1].id);
  assert(events[2].timestamp_ms == start + 10);
  assert(events[3].timestamp_ms == end - 1);

  assert(!events[0].price_per_unit.has_value());
  assert(events[0].quantity == 1.25);
  assert(events[0].kind == EventKind::kGeneration);
  assert(events[0].source == "local_pv");
  assert(events[2].price_per_unit.has_value() && *events[2].price_per_unit == 0.0);
  assert(events[2].unit == Unit::kEur);
}

void VerifyBatchesAndLines(Repository& repo, const std::string& prefix, std::int64_t day) {
  const auto a     = InsertParticipant(repo, prefix + "-a", Role::kTenant);
  const auto b     = InsertParticipant(repo, prefix + "-b", Role::kLandlord);
  const auto start = kStartMs + day * kDayMs;
  const auto use   = prefix + "-use-case";

  std::int64_t batch_id = 0;
  {
    auto tx = repo.Begin();

    PolicyRecord policy{.use_case = use, .body_json = R"({"parameters":{},"use_case":"x"})", .created_at_ms = NowMs()};
    const auto   policy_inserted = repo.InsertPolicy(*tx, policy);
    assert(policy_inserted);

    SettlementBatchRecord batch{.use_case = use, .start_ms = start, .end_ms = start + kDayMs, .created_at_ms = NowMs(), .policy_id = policy.id};
    const auto            batch_inserted = repo.InsertBatch(*tx, batch);
    assert(batch_inserted);
    batch_id = batch.id;

    SettlementLineRecord first{.batch_id = batch.id, .participant_id = b, .amount_cents = -280, .description = "receives", .proof_hash = "h1"};
    SettlementLineRecord second{.batch_id = batch.id, .participant_id = a, .amount_cents = 280, .description = "pays", .proof_hash = "h2"};
    const auto           first_inserted  = repo.InsertLine(*tx, first);
    const auto           second_inserted = repo.InsertLine(*tx, second);
    assert(first_inserted && second_inserted);
    assert(second.id > first.id);

    // Reads inside the transaction see its own writes.
    assert(repo.ListLines(*tx, batch.id).size() == 2);
    tx->Commit();
  }

  auto tx = repo.Begin();

  auto batch = repo.GetBatch(*tx, batch_id);
  assert(batch.has_value());
  assert(batch->use_case == use);
  assert(batch->start_ms == start);
  assert(batch->end_ms == start + kDayMs);

  auto policy = repo.GetPolicy(*tx, batch->policy_id);
  assert(policy.has_value());
  assert(policy->body_json == R"({"parameters":{},"use_case":"x"})");

  auto lines = repo.ListLines(*tx, batch_id);
  assert(lines.size() == 2);
  assert(lines[0].participant_id == b);
  assert(lines[0].amount_cents == -280);
  assert(lines[1].amount_cents == 280);
  assert(lines[1].proof_hash == "h2");

  assert(repo.ListOverlappingBatches(*tx, use, start + kDayMs / 2, start + 2 * kDayMs).size() == 1);
  assert(repo.ListOverlappingBatches(*tx, use, start + kDayMs, start + 2 * kDayMs).empty() && "Adjacent windows do not overlap.");
  assert(repo.ListOverlappingBatches(*tx, use, start - kDayMs, start).empty());
  assert(repo.ListOverlappingBatches(*tx, prefix + "-other", start, start + kDayMs).empty());

  assert(!repo.GetBatch(*tx, batch_id + 1000).has_value());
  assert(repo.ListLines(*tx, batch_id + 1000).empty());

  SettlementBatchRecord dangling{.use_case = use, .start_ms = start, .end_ms = start + kDayMs, .created_at_ms = NowMs(), .policy_id = 1'000'000};
  assert(!repo.InsertBatch(*tx, dangling) && "A batch must reference a stored policy.");
  tx->Rollback();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto              tx = repo.Begin();
    ParticipantRecord record{.external_id = prefix + "-rolled-back", .name = "x", .role = Role::kConsumer};
    const auto        inserted = repo.InsertParticipant(*tx, record);
    assert(inserted);
    tx->Rollback();
  }
  {
    auto              tx = repo.Begin();
    ParticipantRecord record{.external_id = prefix + "-dropped", .name = "x", .role = Role::kConsumer};
    const auto        inserted = repo.InsertParticipant(*tx, record);
    assert(inserted);
    // destroyed without commit
  }

  auto tx = repo.BeginRead();
  assert(!repo.GetParticipantByExternalId(*tx, prefix + "-rolled-back").has_value());
  assert(!repo.GetParticipantByExternalId(*tx, prefix + "-dropped").has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.durable) {
    return;
  }

  std::int64_t id = 0;
  {
    auto repo = backend.make_repository();
    id        = InsertParticipant(*repo, prefix + "-durable", Role::kOperator);
  }

  auto repo = backend.make_repository();
  auto tx   = repo->BeginRead();
  auto p    = repo->GetParticipant(*tx, id);
  assert(p.has_value());
  assert(p->external_id == prefix + "-durable");
  assert(p->role == Role::kOperator);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  settle::runtime::config::DatabaseConfig database;
  database.mutable_memory();
  return BackendFactory{
      .name            = "memory",
      .make_repository = [database]() { return settle::factory::BuildRepository(database); },
      .durable         = false,
      .cleanup         = []() {},
  };
}

#if SETTLE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("settlement_engine_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  settle::runtime::config::DatabaseConfig database;
  database.mutable_sqlite()->set_path(db_path);

  return BackendFactory{
      .name            = "sqlite",
      .make_repository = [database]() { return settle::factory::BuildRepository(database); },
      .durable         = true,
      .cleanup         = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if SETTLE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("SETTLE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("SETTLE_TEST_POSTGRES_URI is not set");
  }

  settle::runtime::config::DatabaseConfig database;
  database.mutable_postgres()->set_connection_uri(uri);

  return BackendFactory{
      .name            = "postgres",
      .make_repository = [database]() { return settle::factory::BuildRepository(database); },
      .durable         = true,
      .cleanup         = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // Unique per run so a reused Postgres database does not collide.
  const auto prefix = backend.name + "-" + std::to_string(NowMs());
  const auto day    = (NowMs() / 1000) % 10'000;

  VerifyParticipants(*repo, prefix);
  VerifyEventWindow(*repo, prefix, day);
  VerifyBatchesAndLines(*repo, prefix, day);
  VerifyRollbackBehavior(*repo, prefix);

  repo.reset();
  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SETTLE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if SETTLE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "settle_integration_repository_parity: pass\n";
  return 0;
}

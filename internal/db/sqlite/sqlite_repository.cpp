#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace settle::db::sqlite {

using settle::db::ErrorCode;
using settle::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// Read paths have no Result to report into; a statement that fails to
// prepare is a schema bug.
Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

model::ParticipantRecord ReadParticipant(sqlite3_stmt* st) {
  model::ParticipantRecord r;
  r.id          = ColI64(st, 0);
  r.external_id = ColText(st, 1);
  r.name        = ColText(st, 2);
  r.role        = settle::model::ParseRole(ColText(st, 3)).value_or(settle::model::Role::kUnspecified);
  return r;
}

model::UsageEventRecord ReadEvent(sqlite3_stmt* st) {
  model::UsageEventRecord r;
  r.id             = ColI64(st, 0);
  r.participant_id = ColI64(st, 1);
  r.kind           = settle::model::ParseEventKind(ColText(st, 2)).value_or(settle::model::EventKind::kUnspecified);
  r.quantity       = sqlite3_column_double(st, 3);
  r.unit           = settle::model::ParseUnit(ColText(st, 4)).value_or(settle::model::Unit::kUnspecified);
  r.timestamp_ms   = ColI64(st, 5);
  r.source         = ColText(st, 6);
  if (sqlite3_column_type(st, 7) != SQLITE_NULL) {
    r.price_per_unit = sqlite3_column_double(st, 7);
  }
  return r;
}

model::SettlementBatchRecord ReadBatch(sqlite3_stmt* st) {
  model::SettlementBatchRecord r;
  r.id            = ColI64(st, 0);
  r.use_case      = ColText(st, 1);
  r.start_ms      = ColI64(st, 2);
  r.end_ms        = ColI64(st, 3);
  r.created_at_ms = ColI64(st, 4);
  r.policy_id     = ColI64(st, 5);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, false);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(db_, true);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Participants
// ------------------------------------------------------------------

Result SqliteRepository::InsertParticipant(Transaction& t, model::ParticipantRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, "INSERT INTO participants(external_id,name,role) VALUES(?,?,?);", -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw);

  BindText(st.get(), 1, r.external_id);
  BindText(st.get(), 2, r.name);
  BindText(st.get(), 3, std::string(settle::model::ToString(r.role)));

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = sqlite3_last_insert_rowid(db);
  return Result::Ok();
}

std::optional<model::ParticipantRecord> SqliteRepository::GetParticipant(Transaction& t, std::int64_t id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT id,external_id,name,role FROM participants WHERE id=?;");
  BindI64(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadParticipant(st.get());
}

std::optional<model::ParticipantRecord> SqliteRepository::GetParticipantByExternalId(Transaction& t, const std::string& external_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT id,external_id,name,role FROM participants WHERE external_id=?;");
  BindText(st.get(), 1, external_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadParticipant(st.get());
}

std::vector<model::ParticipantRecord> SqliteRepository::ListParticipants(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT id,external_id,name,role FROM participants ORDER BY id ASC;");

  std::vector<model::ParticipantRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadParticipant(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Usage events
// ------------------------------------------------------------------

Result SqliteRepository::InsertEvent(Transaction& t, model::UsageEventRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, "INSERT INTO usage_events(participant_id,kind,quantity,unit,timestamp_ms,source,price_per_unit) VALUES(?,?,?,?,?,?,?);", -1,
                         &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw);

  BindI64(st.get(), 1, r.participant_id);
  BindText(st.get(), 2, std::string(settle::model::ToString(r.kind)));
  BindDouble(st.get(), 3, r.quantity);
  BindText(st.get(), 4, std::string(settle::model::ToString(r.unit)));
  BindI64(st.get(), 5, r.timestamp_ms);
  BindText(st.get(), 6, r.source);
  if (r.price_per_unit) {
    BindDouble(st.get(), 7, *r.price_per_unit);
  } else {
    sqlite3_bind_null(st.get(), 7);
  }

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = sqlite3_last_insert_rowid(db);
  return Result::Ok();
}

std::vector<model::UsageEventRecord> SqliteRepository::ListEventsInWindow(Transaction& t, std::int64_t start_ms, std::int64_t end_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT id,participant_id,kind,quantity,unit,timestamp_ms,source,price_per_unit FROM usage_events "
                     "WHERE timestamp_ms>=? AND timestamp_ms<? ORDER BY timestamp_ms ASC, id ASC;");
  BindI64(st.get(), 1, start_ms);
  BindI64(st.get(), 2, end_ms);

  std::vector<model::UsageEventRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadEvent(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Policies
// ------------------------------------------------------------------

Result SqliteRepository::InsertPolicy(Transaction& t, model::PolicyRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, "INSERT INTO policies(use_case,body_json,created_at_ms) VALUES(?,?,?);", -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw);

  BindText(st.get(), 1, r.use_case);
  BindText(st.get(), 2, r.body_json);
  BindI64(st.get(), 3, r.created_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = sqlite3_last_insert_rowid(db);
  return Result::Ok();
}

std::optional<model::PolicyRecord> SqliteRepository::GetPolicy(Transaction& t, std::int64_t id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT id,use_case,body_json,created_at_ms FROM policies WHERE id=?;");
  BindI64(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::PolicyRecord r;
  r.id            = ColI64(st.get(), 0);
  r.use_case      = ColText(st.get(), 1);
  r.body_json     = ColText(st.get(), 2);
  r.created_at_ms = ColI64(st.get(), 3);
  return r;
}

// ------------------------------------------------------------------
// Settlement batches and lines
// ------------------------------------------------------------------

Result SqliteRepository::InsertBatch(Transaction& t, model::SettlementBatchRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, "INSERT INTO settlement_batches(use_case,start_ms,end_ms,created_at_ms,policy_id) VALUES(?,?,?,?,?);", -1, &raw,
                         nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw);

  BindText(st.get(), 1, r.use_case);
  BindI64(st.get(), 2, r.start_ms);
  BindI64(st.get(), 3, r.end_ms);
  BindI64(st.get(), 4, r.created_at_ms);
  BindI64(st.get(), 5, r.policy_id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = sqlite3_last_insert_rowid(db);
  return Result::Ok();
}

std::optional<model::SettlementBatchRecord> SqliteRepository::GetBatch(Transaction& t, std::int64_t id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT id,use_case,start_ms,end_ms,created_at_ms,policy_id FROM settlement_batches WHERE id=?;");
  BindI64(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadBatch(st.get());
}

std::vector<model::SettlementBatchRecord> SqliteRepository::ListOverlappingBatches(Transaction& t, const std::string& use_case, std::int64_t start_ms,
                                                                                  std::int64_t end_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT id,use_case,start_ms,end_ms,created_at_ms,policy_id FROM settlement_batches "
                     "WHERE use_case=? AND start_ms<? AND end_ms>? ORDER BY id ASC;");
  BindText(st.get(), 1, use_case);
  BindI64(st.get(), 2, end_ms);
  BindI64(st.get(), 3, start_ms);

  std::vector<model::SettlementBatchRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadBatch(st.get()));
  }
  return out;
}

Result SqliteRepository::InsertLine(Transaction& t, model::SettlementLineRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, "INSERT INTO settlement_lines(batch_id,participant_id,amount_cents,description,proof_hash) VALUES(?,?,?,?,?);", -1,
                         &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw);

  BindI64(st.get(), 1, r.batch_id);
  BindI64(st.get(), 2, r.participant_id);
  BindI64(st.get(), 3, r.amount_cents);
  BindText(st.get(), 4, r.description);
  BindText(st.get(), 5, r.proof_hash);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = sqlite3_last_insert_rowid(db);
  return Result::Ok();
}

std::vector<model::SettlementLineRecord> SqliteRepository::ListLines(Transaction& t, std::int64_t batch_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT id,batch_id,participant_id,amount_cents,description,proof_hash FROM settlement_lines "
                     "WHERE batch_id=? ORDER BY id ASC;");
  BindI64(st.get(), 1, batch_id);

  std::vector<model::SettlementLineRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::SettlementLineRecord r;
    r.id             = ColI64(st.get(), 0);
    r.batch_id       = ColI64(st.get(), 1);
    r.participant_id = ColI64(st.get(), 2);
    r.amount_cents   = ColI64(st.get(), 3);
    r.description    = ColText(st.get(), 4);
    r.proof_hash     = ColText(st.get(), 5);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace settle::db::sqlite

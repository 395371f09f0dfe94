#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace transcription::db::sqlite {

using transcription::db::ErrorCode;
using transcription::db::Result;

namespace {

constexpr const char* kJobColumns =
    "id,asset_id,provider,language,owner,status,transcript_json,error_message,summary_json,created_at_ms,updated_at_ms";

constexpr const char* kAssetColumns = "id,key_namespace,content_key,display_name,mime_type,owner,created_at_ms";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  if (!t) return {};
  return std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col)));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

std::string Sql(const char* head, const char* columns, const char* tail) {
  return std::string(head) + columns + tail;
}

// reads fail loudly; a broken statement here is a schema bug, not a miss
void RequirePrepared(const Statement& st, sqlite3* db) {
  if (!st.Ok()) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
}

model::AssetRecord ReadAsset(sqlite3_stmt* st) {
  model::AssetRecord r;
  r.id            = ColText(st, 0);
  r.key_namespace = ColText(st, 1);
  r.content_key   = ColText(st, 2);
  r.display_name  = ColText(st, 3);
  r.mime_type     = ColText(st, 4);
  r.owner         = ColText(st, 5);
  r.created_at_ms = ColU64(st, 6);
  return r;
}

model::JobRecord ReadJob(sqlite3_stmt* st) {
  model::JobRecord r;
  r.id              = ColText(st, 0);
  r.asset_id        = ColText(st, 1);
  r.provider        = ColText(st, 2);
  r.language        = ColText(st, 3);
  r.owner           = ColText(st, 4);
  r.status          = static_cast<transcription::model::JobStatus>(ColI32(st, 5));
  r.transcript_json = ColText(st, 6);
  r.error_message   = ColText(st, 7);
  r.summary_json    = ColText(st, 8);
  r.created_at_ms   = ColU64(st, 9);
  r.updated_at_ms   = ColU64(st, 10);
  return r;
}

std::vector<model::JobRecord> ReadJobs(sqlite3_stmt* st, sqlite3* db) {
  std::vector<model::JobRecord> out;
  int                           rc = SQLITE_OK;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadJob(st));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
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
// Assets
// ------------------------------------------------------------------

Result SqliteRepository::InsertAsset(Transaction& t, const model::AssetRecord& r) {
  auto* db = TX(t).Handle();

  const auto sql = Sql("INSERT INTO media_asset(", kAssetColumns, ") VALUES(?,?,?,?,?,?,?);");
  Statement  st(db, sql.c_str());
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.Get(), 1, r.id);
  BindText(st.Get(), 2, r.key_namespace);
  BindText(st.Get(), 3, r.content_key);
  BindText(st.Get(), 4, r.display_name);
  BindText(st.Get(), 5, r.mime_type);
  BindText(st.Get(), 6, r.owner);
  BindU64(st.Get(), 7, r.created_at_ms);

  return Translate(db, sqlite3_step(st.Get()));
}

std::optional<model::AssetRecord> SqliteRepository::GetAsset(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  const auto sql = Sql("SELECT ", kAssetColumns, " FROM media_asset WHERE id=?;");
  Statement  st(db, sql.c_str());
  RequirePrepared(st, db);

  BindText(st.Get(), 1, id);
  if (sqlite3_step(st.Get()) != SQLITE_ROW) return std::nullopt;
  return ReadAsset(st.Get());
}

std::optional<model::AssetRecord> SqliteRepository::FindAssetByKey(Transaction& t, const std::string& key_namespace, const std::string& content_key) {
  auto* db = TX(t).Handle();

  const auto sql = Sql("SELECT ", kAssetColumns, " FROM media_asset WHERE key_namespace=? AND content_key=?;");
  Statement  st(db, sql.c_str());
  RequirePrepared(st, db);

  BindText(st.Get(), 1, key_namespace);
  BindText(st.Get(), 2, content_key);
  if (sqlite3_step(st.Get()) != SQLITE_ROW) return std::nullopt;
  return ReadAsset(st.Get());
}

Result SqliteRepository::DeleteAsset(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM media_asset WHERE id=?;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.Get(), 1, id);
  auto result = Translate(db, sqlite3_step(st.Get()));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto* db = TX(t).Handle();

  const auto sql = Sql("INSERT INTO transcription_job(", kJobColumns, ") VALUES(?,?,?,?,?,?,?,?,?,?,?);");
  Statement  st(db, sql.c_str());
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.Get(), 1, r.id);
  BindText(st.Get(), 2, r.asset_id);
  BindText(st.Get(), 3, r.provider);
  BindText(st.Get(), 4, r.language);
  BindText(st.Get(), 5, r.owner);
  BindI32(st.Get(), 6, static_cast<int>(r.status));
  BindText(st.Get(), 7, r.transcript_json);
  BindText(st.Get(), 8, r.error_message);
  BindText(st.Get(), 9, r.summary_json);
  BindU64(st.Get(), 10, r.created_at_ms);
  BindU64(st.Get(), 11, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.Get()));
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  const auto sql = Sql("SELECT ", kJobColumns, " FROM transcription_job WHERE id=?;");
  Statement  st(db, sql.c_str());
  RequirePrepared(st, db);

  BindText(st.Get(), 1, id);
  if (sqlite3_step(st.Get()) != SQLITE_ROW) return std::nullopt;
  return ReadJob(st.Get());
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE transcription_job SET status=?,transcript_json=?,error_message=?,summary_json=?,updated_at_ms=? "
               "WHERE id=?;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st.Get(), 1, static_cast<int>(r.status));
  BindText(st.Get(), 2, r.transcript_json);
  BindText(st.Get(), 3, r.error_message);
  BindText(st.Get(), 4, r.summary_json);
  BindU64(st.Get(), 5, r.updated_at_ms);
  BindText(st.Get(), 6, r.id);

  auto result = Translate(db, sqlite3_step(st.Get()));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

Result SqliteRepository::DeleteJob(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM transcription_job WHERE id=?;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.Get(), 1, id);
  auto result = Translate(db, sqlite3_step(st.Get()));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

std::vector<model::JobRecord> SqliteRepository::FindJobsByKey(Transaction& t, const std::string& asset_id, const std::string& provider,
                                                              const std::string& language) {
  auto* db = TX(t).Handle();

  const auto sql = Sql("SELECT ", kJobColumns,
                       " FROM transcription_job WHERE asset_id=? AND provider=? AND language=? ORDER BY created_at_ms DESC, seq DESC;");
  Statement st(db, sql.c_str());
  RequirePrepared(st, db);

  BindText(st.Get(), 1, asset_id);
  BindText(st.Get(), 2, provider);
  BindText(st.Get(), 3, language);
  return ReadJobs(st.Get(), db);
}

uint64_t SqliteRepository::CountJobsForAsset(Transaction& t, const std::string& asset_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT COUNT(*) FROM transcription_job WHERE asset_id=?;");
  RequirePrepared(st, db);

  BindText(st.Get(), 1, asset_id);
  if (sqlite3_step(st.Get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return ColU64(st.Get(), 0);
}

std::vector<model::JobRecord> SqliteRepository::ListJobsByOwner(Transaction& t, const std::string& owner) {
  auto* db = TX(t).Handle();

  const auto sql = Sql("SELECT ", kJobColumns, " FROM transcription_job WHERE owner=? ORDER BY created_at_ms DESC, seq DESC;");
  Statement  st(db, sql.c_str());
  RequirePrepared(st, db);

  BindText(st.Get(), 1, owner);
  return ReadJobs(st.Get(), db);
}

std::vector<model::JobRecord> SqliteRepository::ListJobsByStatus(Transaction& t, transcription::model::JobStatus status) {
  auto* db = TX(t).Handle();

  const auto sql = Sql("SELECT ", kJobColumns, " FROM transcription_job WHERE status=? ORDER BY created_at_ms ASC, seq ASC;");
  Statement  st(db, sql.c_str());
  RequirePrepared(st, db);

  BindI32(st.Get(), 1, static_cast<int>(status));
  return ReadJobs(st.Get(), db);
}

} // namespace transcription::db::sqlite

#include "sqlite_db.hpp"

#include <stdexcept>
#include <string>

namespace transcription::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure() {
  // WAL lets status polls read while a worker commits
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  // asset deletion relies on the job -> asset reference being enforced
  Exec("PRAGMA foreign_keys=ON;");
  ThrowIf(sqlite3_busy_timeout(db_, kBusyTimeoutMs), db_, "busy_timeout");
}

int SqliteDB::UserVersion() {
  Statement stmt(db_, "PRAGMA user_version;");
  if (!stmt.Ok() || sqlite3_step(stmt.Get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("read user_version: ") + sqlite3_errmsg(db_));
  }
  return sqlite3_column_int(stmt.Get(), 0);
}

Statement::Statement(sqlite3* db, const char* sql) {
  if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void BootstrapSchema(SqliteDB& db) {
  const int version = db.UserVersion();
  if (version == kSchemaVersion) {
    return;
  }
  if (version > kSchemaVersion) {
    throw std::runtime_error(db.Path() + ": schema version " + std::to_string(version) + " is newer than supported version " + std::to_string(kSchemaVersion));
  }

  static const char* const kSchemaV1[] = {
      "CREATE TABLE IF NOT EXISTS media_asset ("
      " id TEXT PRIMARY KEY,"
      " key_namespace TEXT NOT NULL,"
      " content_key TEXT NOT NULL,"
      " display_name TEXT NOT NULL,"
      " mime_type TEXT NOT NULL,"
      " owner TEXT NOT NULL,"
      " created_at_ms INTEGER NOT NULL,"
      " UNIQUE(key_namespace, content_key));",
      "CREATE TABLE IF NOT EXISTS transcription_job ("
      " seq INTEGER PRIMARY KEY AUTOINCREMENT,"
      " id TEXT NOT NULL UNIQUE,"
      " asset_id TEXT NOT NULL REFERENCES media_asset(id),"
      " provider TEXT NOT NULL,"
      " language TEXT NOT NULL,"
      " owner TEXT NOT NULL,"
      " status INTEGER NOT NULL,"
      " transcript_json TEXT NOT NULL DEFAULT '',"
      " error_message TEXT NOT NULL DEFAULT '',"
      " summary_json TEXT NOT NULL DEFAULT '',"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS transcription_job_key ON transcription_job(asset_id, provider, language);",
      "CREATE INDEX IF NOT EXISTS transcription_job_owner ON transcription_job(owner);",
      // one PENDING/PROCESSING job per dedup key
      "CREATE UNIQUE INDEX IF NOT EXISTS transcription_job_live ON transcription_job(asset_id, provider, language) WHERE status IN (1, 2);"};

  db.Exec("BEGIN IMMEDIATE;");
  try {
    for (const char* sql : kSchemaV1) {
      db.Exec(sql);
    }
    db.Exec("PRAGMA user_version = " + std::to_string(kSchemaVersion) + ";");
    db.Exec("COMMIT;");
  } catch (const std::exception&) {
    db.Exec("ROLLBACK;");
    throw;
  }
}

} // namespace transcription::db::sqlite

#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace transcription::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every thread; tx_mutex serializes transactions
  so a BEGIN from one worker never lands inside another's.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  const std::string& Path() const {
    return path_;
  }

  // statements without results: pragmas, schema, BEGIN/COMMIT
  void Exec(const std::string& sql);

  int UserVersion();

 private:
  static constexpr int kBusyTimeoutMs = 5000;

  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

/*
  Prepared statement, finalized on scope exit.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* Get() const {
    return stmt_;
  }

  bool Ok() const {
    return stmt_ != nullptr;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

inline constexpr int kSchemaVersion = 1;

// Brings an empty database to kSchemaVersion (tracked in PRAGMA user_version);
// refuses files written by a newer build.
void BootstrapSchema(SqliteDB& db);

} // namespace transcription::db::sqlite

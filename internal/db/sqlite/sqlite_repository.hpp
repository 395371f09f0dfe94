#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace transcription::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                             InsertAsset(Transaction&, const model::AssetRecord&) override;
  std::optional<model::AssetRecord> GetAsset(Transaction&, const std::string&) override;
  std::optional<model::AssetRecord> FindAssetByKey(Transaction&, const std::string& key_namespace, const std::string& content_key) override;
  Result                             DeleteAsset(Transaction&, const std::string&) override;

  Result                          InsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  Result                          UpdateJob(Transaction&, const model::JobRecord&) override;
  Result                          DeleteJob(Transaction&, const std::string&) override;

  std::vector<model::JobRecord> FindJobsByKey(Transaction&, const std::string& asset_id, const std::string& provider,
                                              const std::string& language) override;
  uint64_t                      CountJobsForAsset(Transaction&, const std::string& asset_id) override;
  std::vector<model::JobRecord> ListJobsByOwner(Transaction&, const std::string& owner) override;
  std::vector<model::JobRecord> ListJobsByStatus(Transaction&, transcription::model::JobStatus status) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace transcription::db::sqlite

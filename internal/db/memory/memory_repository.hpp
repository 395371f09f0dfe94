#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace transcription::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::AssetRecord> assets;
    std::unordered_map<std::string, std::string>        asset_keys; // namespace#key -> id

    std::unordered_map<std::string, model::JobRecord> jobs;
    std::unordered_map<std::string, uint64_t>         job_order; // insertion sequence, breaks created_at ties
    uint64_t                                          next_order = 1;
  };

  std::mutex mutex_;
  State      committed_;
};

} // namespace transcription::db::memory

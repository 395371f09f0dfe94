#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/asset_record.hpp"
#include "internal/db/model/job_record.hpp"

namespace transcription::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - InsertAsset rejects a duplicate (key_namespace, content_key)
  - InsertJob rejects a second live job for the same
    (asset_id, provider, language) with ConstraintViolation

  The DB is the source of truth for:
    assets
    job lifecycle and results
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Assets
  // ---------------------------------------------------------------------

  virtual Result InsertAsset(Transaction&, const model::AssetRecord&) = 0;

  virtual std::optional<model::AssetRecord> GetAsset(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::AssetRecord> FindAssetByKey(Transaction&, const std::string& key_namespace, const std::string& content_key) = 0;

  virtual Result DeleteAsset(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  virtual Result InsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& id) = 0;

  virtual Result UpdateJob(Transaction&, const model::JobRecord&) = 0;

  virtual Result DeleteJob(Transaction&, const std::string& id) = 0;

  // All jobs for a dedup key, newest first.
  virtual std::vector<model::JobRecord> FindJobsByKey(Transaction&, const std::string& asset_id, const std::string& provider,
                                                      const std::string& language) = 0;

  virtual uint64_t CountJobsForAsset(Transaction&, const std::string& asset_id) = 0;

  // newest first
  virtual std::vector<model::JobRecord> ListJobsByOwner(Transaction&, const std::string& owner) = 0;

  // oldest first
  virtual std::vector<model::JobRecord> ListJobsByStatus(Transaction&, transcription::model::JobStatus status) = 0;
};

} // namespace transcription::db

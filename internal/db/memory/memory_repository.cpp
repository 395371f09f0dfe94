#include "memory_repository.hpp"

#include <algorithm>
#include <utility>

#include "memory_tx.hpp"

namespace transcription::db::memory {

namespace {

std::string AssetKey(const std::string& key_namespace, const std::string& content_key) {
  return key_namespace + "#" + content_key;
}

bool SameKey(const model::JobRecord& a, const model::JobRecord& b) {
  return a.asset_id == b.asset_id && a.provider == b.provider && a.language == b.language;
}

// (created_at, insertion order) ascending
std::vector<model::JobRecord> Ordered(const std::unordered_map<std::string, uint64_t>& order, std::vector<model::JobRecord> jobs, bool newest_first) {
  std::sort(jobs.begin(), jobs.end(), [&](const model::JobRecord& a, const model::JobRecord& b) {
    const auto ka = std::make_pair(a.created_at_ms, order.at(a.id));
    const auto kb = std::make_pair(b.created_at_ms, order.at(b.id));
    return newest_first ? kb < ka : ka < kb;
  });
  return jobs;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Assets
// ------------------------------------------------------------------

Result MemoryRepository::InsertAsset(Transaction& t, const model::AssetRecord& r) {
  auto&      s   = TX(t).Mutable();
  const auto key = AssetKey(r.key_namespace, r.content_key);
  if (s.assets.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "asset id exists");
  if (s.asset_keys.contains(key)) return Result::Err(ErrorCode::ConstraintViolation, "asset key exists: " + key);
  s.assets[r.id]    = r;
  s.asset_keys[key] = r.id;
  return Result::Ok();
}

std::optional<model::AssetRecord> MemoryRepository::GetAsset(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.assets.find(id);
  if (it == s.assets.end()) return std::nullopt;
  return it->second;
}

std::optional<model::AssetRecord> MemoryRepository::FindAssetByKey(Transaction& t, const std::string& key_namespace, const std::string& content_key) {
  const auto& s  = TX(t).View();
  auto        it = s.asset_keys.find(AssetKey(key_namespace, content_key));
  if (it == s.asset_keys.end()) return std::nullopt;
  return s.assets.at(it->second);
}

Result MemoryRepository::DeleteAsset(Transaction& t, const std::string& id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.assets.find(id);
  if (it == s.assets.end()) return Result::Err(ErrorCode::NotFound);

  // same restriction as the foreign key in the sqlite schema
  for (const auto& [_, job] : s.jobs) {
    if (job.asset_id == id) return Result::Err(ErrorCode::ConstraintViolation, "asset still referenced by a job");
  }

  s.asset_keys.erase(AssetKey(it->second.key_namespace, it->second.content_key));
  s.assets.erase(it);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.jobs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "job id exists");
  if (!s.assets.contains(r.asset_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown asset " + r.asset_id);

  if (transcription::model::IsLive(r.status)) {
    for (const auto& [_, job] : s.jobs) {
      if (SameKey(job, r) && transcription::model::IsLive(job.status)) {
        return Result::Err(ErrorCode::ConstraintViolation, "live job exists for key");
      }
    }
  }

  s.jobs[r.id]      = r;
  s.job_order[r.id] = s.next_order++;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(r.id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound);

  if (transcription::model::IsLive(r.status)) {
    for (const auto& [id, job] : s.jobs) {
      if (id != r.id && SameKey(job, r) && transcription::model::IsLive(job.status)) {
        return Result::Err(ErrorCode::ConstraintViolation, "live job exists for key");
      }
    }
  }

  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteJob(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.jobs.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
  s.job_order.erase(id);
  return Result::Ok();
}

std::vector<model::JobRecord> MemoryRepository::FindJobsByKey(Transaction& t, const std::string& asset_id, const std::string& provider,
                                                              const std::string& language) {
  const auto&                   s = TX(t).View();
  std::vector<model::JobRecord> out;
  for (const auto& [_, job] : s.jobs) {
    if (job.asset_id == asset_id && job.provider == provider && job.language == language) out.push_back(job);
  }
  return Ordered(s.job_order, std::move(out), true);
}

uint64_t MemoryRepository::CountJobsForAsset(Transaction& t, const std::string& asset_id) {
  const auto& s = TX(t).View();
  return static_cast<uint64_t>(std::count_if(s.jobs.begin(), s.jobs.end(), [&](const auto& entry) { return entry.second.asset_id == asset_id; }));
}

std::vector<model::JobRecord> MemoryRepository::ListJobsByOwner(Transaction& t, const std::string& owner) {
  const auto&                   s = TX(t).View();
  std::vector<model::JobRecord> out;
  for (const auto& [_, job] : s.jobs) {
    if (job.owner == owner) out.push_back(job);
  }
  return Ordered(s.job_order, std::move(out), true);
}

std::vector<model::JobRecord> MemoryRepository::ListJobsByStatus(Transaction& t, transcription::model::JobStatus status) {
  const auto&                   s = TX(t).View();
  std::vector<model::JobRecord> out;
  for (const auto& [_, job] : s.jobs) {
    if (job.status == status) out.push_back(job);
  }
  return Ordered(s.job_order, std::move(out), false);
}

} // namespace transcription::db::memory

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/jobs/job_queue.hpp"
#include "internal/jobs/job_worker.hpp"
#include "internal/media/media_registry.hpp"
#include "internal/providers/provider_context.hpp"
#include "internal/sources/youtube.hpp"
#include "transcription/manager/core/v1/types.pb.h"

namespace transcription::core {

struct UploadRef {
  std::string file_name;
  std::string mime_type;
  std::string content;
};

struct YoutubeRef {
  std::string url;
};

using AssetRef = std::variant<UploadRef, YoutubeRef>;

struct SubmitResult {
  db::model::JobRecord                                       job;
  transcription::manager::core::v1::SubmitDisposition disposition = transcription::manager::core::v1::SUBMIT_DISPOSITION_UNSPECIFIED;
};

// one row of the history view
struct JobHistoryEntry {
  db::model::JobRecord   job;
  db::model::AssetRecord asset;
};

struct RecoveryStats {
  std::size_t requeued    = 0;
  std::size_t interrupted = 0;
};

struct ManagerOptions {
  std::filesystem::path temp_root;
};

/*
  Dedup-aware job pipeline.

  Submit resolves the asset, then answers from the newest COMPLETED job for
  (asset, provider, language), else the live job, else creates a PENDING job
  and queues it. Workers drive PENDING -> PROCESSING -> COMPLETED | FAILED
  through ExecuteJob; failures never reach the submitter, they land in
  error_message.

  The one-live-job rule is enforced by the repository, not by locking here:
  a ConstraintViolation on insert means another submission won the race.
*/
class TranscriptionManager : public jobs::JobExecutor {
 public:
  TranscriptionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<media::MediaRegistry> registry,
                       providers::ProviderContextPtr providers, std::shared_ptr<jobs::JobQueue> queue, std::shared_ptr<sources::YoutubeSource> youtube,
                       ManagerOptions options = {});

  SubmitResult Submit(const AssetRef& source, const std::string& provider, const std::string& language, const std::string& owner);

  // throws util::NotFound
  db::model::JobRecord Status(const std::string& job_id);

  // fresh job on the same asset, bypassing completed results
  SubmitResult Regenerate(const std::string& job_id, const std::string& provider, const std::string& language, const std::string& owner);

  // removes the job; the asset and its media go with the last referencing job
  void Delete(const std::string& job_id, const std::string& owner);

  std::vector<JobHistoryEntry> ListJobs(const std::string& owner);

  // cached after the first successful call
  transcription::manager::core::v1::Summary Summarize(const std::string& job_id);

  void ExecuteJob(const std::string& job_id) override;

  // PENDING rows are queued again; PROCESSING rows lost their worker and fail
  RecoveryStats RecoverOnStartup();

 private:
  db::model::AssetRecord ResolveUpload(const UploadRef& upload, const std::string& owner);
  db::model::AssetRecord ResolveYoutube(const YoutubeRef& ref, const std::string& owner);

  SubmitResult SubmitForAsset(const db::model::AssetRecord& asset, const std::string& provider, const std::string& language, const std::string& owner,
                              bool reuse_completed);

  std::optional<db::model::JobRecord> FindLiveJob(const std::string& asset_id, const std::string& provider, const std::string& language);

  db::model::JobRecord LoadJob(db::Transaction& tx, const std::string& job_id);

  // no-op when the row is gone or no longer allows the transition
  void Finish(const std::string& job_id, transcription::model::JobStatus status, const std::string& transcript_json, const std::string& error);

  std::string RunProvider(const db::model::JobRecord& job);

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<media::MediaRegistry>   registry_;
  providers::ProviderContextPtr           providers_;
  std::shared_ptr<jobs::JobQueue>         queue_;
  std::shared_ptr<sources::YoutubeSource> youtube_;
  ManagerOptions                          options_;
};

std::string NormalizeLanguage(const std::string& language);

// owner-less jobs are open to everyone; otherwise the caller must match
void CheckOwner(const db::model::JobRecord& job, const std::string& caller);

} // namespace transcription::core

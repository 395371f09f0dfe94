#include "transcription_manager.hpp"

#include <arrow/buffer.h>

#include <string_view>
#include <type_traits>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/segments/segment_codec.hpp"
#include "internal/util/content_hash.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/mime_type.hpp"
#include "internal/util/temp_file.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace transcription::core {

using namespace transcription::manager::core::v1;

namespace {

constexpr const char* kInterruptedMessage = "interrupted: worker stopped before the job finished";

std::string_view DispositionName(SubmitDisposition d) {
  switch (d) {
    case SUBMIT_DISPOSITION_CREATED:
      return "created";
    case SUBMIT_DISPOSITION_CACHED:
      return "cached";
    case SUBMIT_DISPOSITION_IN_PROGRESS:
      return "in_progress";
    default:
      return "unspecified";
  }
}

std::string TempSuffix(const db::model::AssetRecord& asset) {
  std::string ext = util::ExtensionForMimeType(asset.mime_type);
  if (ext.empty()) {
    ext = std::filesystem::path(asset.display_name).extension().string();
  }
  return ext;
}

} // namespace

std::string NormalizeLanguage(const std::string& language) {
  return language.empty() ? "auto" : language;
}

void CheckOwner(const db::model::JobRecord& job, const std::string& caller) {
  if (!job.owner.empty() && job.owner != caller) {
    throw util::PermissionDenied("job " + job.id + " belongs to another user");
  }
}

TranscriptionManager::TranscriptionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<media::MediaRegistry> registry,
                                           providers::ProviderContextPtr providers, std::shared_ptr<jobs::JobQueue> queue,
                                           std::shared_ptr<sources::YoutubeSource> youtube, ManagerOptions options)
    : repository_(std::move(repository)),
      registry_(std::move(registry)),
      providers_(std::move(providers)),
      queue_(std::move(queue)),
      youtube_(std::move(youtube)),
      options_(std::move(options)) {
  if (!repository_ || !registry_ || !providers_ || !queue_ || !youtube_) {
    throw std::invalid_argument("TranscriptionManager: missing dependency");
  }
}

// ---------------------------------------------------------------------------
// Submission
// ---------------------------------------------------------------------------

SubmitResult TranscriptionManager::Submit(const AssetRef& source, const std::string& provider, const std::string& language, const std::string& owner) {
  observability::SpanScope span("manager.submit");

  if (provider.empty()) {
    throw util::ValidationError("provider is required");
  }
  providers_->Get(provider);

  const auto asset = std::visit(
      [&](const auto& ref) {
        using T = std::decay_t<decltype(ref)>;
        if constexpr (std::is_same_v<T, UploadRef>) {
          return ResolveUpload(ref, owner);
        } else {
          return ResolveYoutube(ref, owner);
        }
      },
      source);

  return SubmitForAsset(asset, provider, NormalizeLanguage(language), owner, true);
}

db::model::AssetRecord TranscriptionManager::ResolveUpload(const UploadRef& upload, const std::string& owner) {
  if (upload.content.empty()) {
    throw util::ValidationError("uploaded file is empty");
  }

  media::AssetMetadata meta;
  meta.display_name = upload.file_name.empty() ? "upload" : upload.file_name;
  meta.mime_type    = upload.mime_type.empty() ? util::GuessMimeType(meta.display_name) : upload.mime_type;
  meta.owner        = owner;

  bool       created = false;
  const auto asset   = registry_->ResolveOrRegister(util::Sha256Hex(upload.content), db::model::kSha256Namespace, meta, &created);

  if (created || !registry_->Store().Contains(asset.id)) {
    registry_->Store().Write(asset.id, arrow::Buffer::FromString(upload.content));
  }
  return asset;
}

db::model::AssetRecord TranscriptionManager::ResolveYoutube(const YoutubeRef& ref, const std::string& owner) {
  const std::string video_id = sources::ParseVideoId(ref.url);

  std::optional<db::model::AssetRecord> known;
  try {
    known = registry_->Resolve(video_id, db::model::kYoutubeNamespace);
  } catch (const util::NotFound&) {
    known.reset();
  }
  if (known && registry_->Store().Contains(known->id)) {
    return *known;
  }

  util::ScopedTempDir workdir(util::ResolveTempRoot(options_.temp_root.string()));
  const auto          audio = youtube_->Download(video_id, workdir.Path());

  media::AssetMetadata meta;
  meta.display_name = audio.title;
  meta.mime_type    = audio.mime_type;
  meta.owner        = owner;

  bool       created = false;
  const auto asset   = registry_->ResolveOrRegister(video_id, db::model::kYoutubeNamespace, meta, &created);
  if (created || !registry_->Store().Contains(asset.id)) {
    registry_->Store().Import(asset.id, audio.path);
  }
  return asset;
}

std::optional<db::model::JobRecord> TranscriptionManager::FindLiveJob(const std::string& asset_id, const std::string& provider, const std::string& language) {
  auto tx   = repository_->Begin();
  auto jobs = repository_->FindJobsByKey(*tx, asset_id, provider, language);
  tx->Commit();
  for (auto& job : jobs) {
    if (model::IsLive(job.status)) {
      return std::move(job);
    }
  }
  return std::nullopt;
}

SubmitResult TranscriptionManager::SubmitForAsset(const db::model::AssetRecord& asset, const std::string& provider, const std::string& language,
                                                  const std::string& owner, bool reuse_completed) {
  SubmitResult result;
  auto         tx   = repository_->Begin();
  auto         jobs = repository_->FindJobsByKey(*tx, asset.id, provider, language);

  const auto answer = [&](db::model::JobRecord job, SubmitDisposition disposition) {
    result.job         = std::move(job);
    result.disposition = disposition;
    observability::Metrics::Instance().RecordSubmission(DispositionName(disposition));
    TRANSCRIPTION_LOG_INFO("submission answered", {observability::StringField("job_id", result.job.id), observability::StringField("asset_id", asset.id),
                                                   observability::StringField("disposition", DispositionName(disposition))});
    return result;
  };

  // newest first, so the first completed row is the freshest result
  if (reuse_completed) {
    for (const auto& job : jobs) {
      if (job.status == JOB_STATUS_COMPLETED) {
        tx->Commit();
        return answer(job, SUBMIT_DISPOSITION_CACHED);
      }
    }
  }
  for (const auto& job : jobs) {
    if (model::IsLive(job.status)) {
      tx->Commit();
      return answer(job, SUBMIT_DISPOSITION_IN_PROGRESS);
    }
  }

  db::model::JobRecord job;
  job.id            = util::NewId();
  job.asset_id      = asset.id;
  job.provider      = provider;
  job.language      = language;
  job.owner         = owner;
  job.status        = JOB_STATUS_PENDING;
  job.created_at_ms = util::NowMillis();
  job.updated_at_ms = job.created_at_ms;

  const auto inserted = repository_->InsertJob(*tx, job);
  if (inserted.code == db::ErrorCode::ConstraintViolation) {
    tx->Rollback();
    // a concurrent submission created the live job first
    if (auto live = FindLiveJob(asset.id, provider, language)) {
      return answer(*live, SUBMIT_DISPOSITION_IN_PROGRESS);
    }
    throw util::Conflict("job for asset " + asset.id + " collided but no live job exists");
  }
  db::ThrowIfDbError(inserted, "insert job");
  tx->Commit();

  queue_->Enqueue(job.id);
  return answer(job, SUBMIT_DISPOSITION_CREATED);
}

// ---------------------------------------------------------------------------
// Queries and mutations
// ---------------------------------------------------------------------------

db::model::JobRecord TranscriptionManager::LoadJob(db::Transaction& tx, const std::string& job_id) {
  auto job = repository_->GetJob(tx, job_id);
  if (!job) {
    throw util::NotFound("job " + job_id + " not found");
  }
  return *job;
}

db::model::JobRecord TranscriptionManager::Status(const std::string& job_id) {
  auto tx  = repository_->Begin();
  auto job = LoadJob(*tx, job_id);
  tx->Commit();
  return job;
}

SubmitResult TranscriptionManager::Regenerate(const std::string& job_id, const std::string& provider, const std::string& language,
                                              const std::string& owner) {
  observability::SpanScope span("manager.regenerate");

  const auto previous = Status(job_id);
  CheckOwner(previous, owner);

  const std::string target_provider = provider.empty() ? previous.provider : provider;
  providers_->Get(target_provider);

  auto asset = registry_->Get(previous.asset_id);
  if (!asset) {
    throw util::NotFound("asset " + previous.asset_id + " of job " + job_id + " no longer exists");
  }

  const std::string target_language = language.empty() ? previous.language : language;
  return SubmitForAsset(*asset, target_provider, target_language, owner.empty() ? previous.owner : owner, false);
}

void TranscriptionManager::Delete(const std::string& job_id, const std::string& owner) {
  auto       tx  = repository_->Begin();
  const auto job = LoadJob(*tx, job_id);
  CheckOwner(job, owner);

  db::ThrowIfDbError(repository_->DeleteJob(*tx, job_id), "delete job " + job_id);
  tx->Commit();

  TRANSCRIPTION_LOG_INFO("job deleted", {observability::StringField("job_id", job_id), observability::StringField("asset_id", job.asset_id)});

  registry_->RemoveIfUnreferenced(job.asset_id);
}

std::vector<JobHistoryEntry> TranscriptionManager::ListJobs(const std::string& owner) {
  auto tx   = repository_->Begin();
  auto jobs = repository_->ListJobsByOwner(*tx, owner);

  std::vector<JobHistoryEntry> entries;
  entries.reserve(jobs.size());
  for (auto& job : jobs) {
    JobHistoryEntry entry;
    if (auto asset = repository_->GetAsset(*tx, job.asset_id)) {
      entry.asset = std::move(*asset);
    }
    entry.job = std::move(job);
    entries.push_back(std::move(entry));
  }
  tx->Commit();
  return entries;
}

Summary TranscriptionManager::Summarize(const std::string& job_id) {
  observability::SpanScope span("manager.summarize");

  const auto job = Status(job_id);
  if (job.status != JOB_STATUS_COMPLETED) {
    throw util::InvalidState("job " + job_id + " is " + std::string(model::StatusName(job.status)) + ", not completed");
  }
  if (!job.summary_json.empty()) {
    return segments::DecodeSummary(job.summary_json);
  }

  const auto transcript = segments::DecodeTranscript(job.transcript_json);
  if (transcript.segments.empty()) {
    throw util::InvalidState("job " + job_id + " has no segments to summarize");
  }

  Summary summary = providers_->GetSummarizer().Summarize(transcript.segments);

  auto tx      = repository_->Begin();
  auto current = LoadJob(*tx, job_id);
  current.summary_json  = segments::EncodeSummary(summary);
  current.updated_at_ms = util::NowMillis();
  db::ThrowIfDbError(repository_->UpdateJob(*tx, current), "store summary for " + job_id);
  tx->Commit();

  TRANSCRIPTION_LOG_INFO("job summarized", {observability::StringField("job_id", job_id),
                                            observability::IntField("points", summary.summary_points_size())});
  return summary;
}

// ---------------------------------------------------------------------------
// Execution
// ---------------------------------------------------------------------------

void TranscriptionManager::ExecuteJob(const std::string& job_id) {
  observability::SpanScope span("job.execute");
  span.SetAttribute("job_id", job_id);

  db::model::JobRecord job;
  {
    auto tx      = repository_->Begin();
    auto current = repository_->GetJob(*tx, job_id);
    if (!current) {
      TRANSCRIPTION_LOG_WARN("queued job vanished", {observability::StringField("job_id", job_id)});
      return;
    }
    if (!model::CanTransition(current->status, JOB_STATUS_PROCESSING)) {
      // already claimed or finished; delivery is at-most-once
      TRANSCRIPTION_LOG_WARN("job not claimable", {observability::StringField("job_id", job_id),
                                                   observability::StringField("status", model::StatusName(current->status))});
      return;
    }
    current->status        = JOB_STATUS_PROCESSING;
    current->updated_at_ms = util::NowMillis();
    db::ThrowIfDbError(repository_->UpdateJob(*tx, *current), "claim job " + job_id);
    tx->Commit();
    job = std::move(*current);
  }

  TRANSCRIPTION_LOG_INFO("job started", {observability::StringField("job_id", job_id), observability::StringField("provider", job.provider),
                                         observability::StringField("language", job.language)});

  std::string transcript_json;
  try {
    transcript_json = RunProvider(job);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    TRANSCRIPTION_LOG_ERROR("job failed", {observability::StringField("job_id", job_id), observability::StringField("error", e.what())});
    Finish(job_id, JOB_STATUS_FAILED, "", e.what());
    return;
  }

  try {
    Finish(job_id, JOB_STATUS_COMPLETED, transcript_json, "");
  } catch (const std::exception& e) {
    // never leave the job PROCESSING
    span.RecordException(e.what());
    TRANSCRIPTION_LOG_ERROR("could not record job result", {observability::StringField("job_id", job_id), observability::StringField("error", e.what())});
    Finish(job_id, JOB_STATUS_FAILED, "", std::string("could not record result: ") + e.what());
  }
}

std::string TranscriptionManager::RunProvider(const db::model::JobRecord& job) {
  auto provider = providers_->Get(job.provider);

  auto asset = registry_->Get(job.asset_id);
  if (!asset) {
    throw util::NotFound("asset " + job.asset_id + " no longer exists");
  }
  const auto bytes = registry_->Store().Read(asset->id);

  util::ScopedTempFile audio(util::ResolveTempRoot(options_.temp_root.string()), TempSuffix(*asset));
  audio.Write(std::string_view(reinterpret_cast<const char*>(bytes->data()), static_cast<std::size_t>(bytes->size())));

  auto result = provider->Transcribe(audio.Path(), job.language);
  if (!result.ok()) {
    const auto& failure = result.failure();
    throw std::runtime_error(failure.kind == providers::ProviderFailure::Kind::kParse ? "parse error: " + failure.message : failure.message);
  }

  auto transcript = providers::ToTranscript(result.TakeOutput(), providers_->MaxSegmentLength());
  if (transcript.detected_language.empty() && job.language != "auto") {
    transcript.detected_language = job.language;
  }
  return segments::EncodeTranscript(transcript);
}

void TranscriptionManager::Finish(const std::string& job_id, model::JobStatus status, const std::string& transcript_json, const std::string& error) {
  auto tx  = repository_->Begin();
  auto job = repository_->GetJob(*tx, job_id);
  if (!job) {
    TRANSCRIPTION_LOG_WARN("job deleted while running", {observability::StringField("job_id", job_id)});
    return;
  }
  if (!model::CanTransition(job->status, status)) {
    TRANSCRIPTION_LOG_WARN("dropping illegal job transition", {observability::StringField("job_id", job_id),
                                                                observability::StringField("from", model::StatusName(job->status)),
                                                                observability::StringField("to", model::StatusName(status))});
    return;
  }

  job->status          = status;
  job->transcript_json = transcript_json;
  job->error_message   = error;
  job->updated_at_ms   = util::NowMillis();
  db::ThrowIfDbError(repository_->UpdateJob(*tx, *job), "finish job " + job_id);
  tx->Commit();

  observability::Metrics::Instance().RecordJobOutcome(job->provider, model::StatusName(status));
  TRANSCRIPTION_LOG_INFO("job finished", {observability::StringField("job_id", job_id), observability::StringField("status", model::StatusName(status))});
}

RecoveryStats TranscriptionManager::RecoverOnStartup() {
  RecoveryStats stats;

  auto tx = repository_->Begin();
  for (auto& job : repository_->ListJobsByStatus(*tx, JOB_STATUS_PROCESSING)) {
    job.status        = JOB_STATUS_FAILED;
    job.error_message = kInterruptedMessage;
    job.updated_at_ms = util::NowMillis();
    db::ThrowIfDbError(repository_->UpdateJob(*tx, job), "recover job " + job.id);
    ++stats.interrupted;
  }
  const auto pending = repository_->ListJobsByStatus(*tx, JOB_STATUS_PENDING);
  tx->Commit();

  for (const auto& job : pending) {
    queue_->Enqueue(job.id);
    ++stats.requeued;
  }

  TRANSCRIPTION_LOG_INFO("startup recovery", {observability::IntField("requeued", static_cast<std::int64_t>(stats.requeued)),
                                              observability::IntField("interrupted", static_cast<std::int64_t>(stats.interrupted))});
  return stats;
}

} // namespace transcription::core

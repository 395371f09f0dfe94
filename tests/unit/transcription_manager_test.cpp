#include "internal/core/transcription_manager.hpp"

#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/segments/segment_codec.hpp"
#include "internal/storage/disk/disk_media_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using transcription::core::SubmitResult;
using transcription::core::TranscriptionManager;
using transcription::core::UploadRef;
using transcription::core::YoutubeRef;
using transcription::manager::core::v1::JOB_STATUS_COMPLETED;
using transcription::manager::core::v1::JOB_STATUS_FAILED;
using transcription::manager::core::v1::JOB_STATUS_PENDING;
using transcription::manager::core::v1::JOB_STATUS_PROCESSING;
using transcription::manager::core::v1::SUBMIT_DISPOSITION_CACHED;
using transcription::manager::core::v1::SUBMIT_DISPOSITION_CREATED;
using transcription::manager::core::v1::SUBMIT_DISPOSITION_IN_PROGRESS;
using transcription::manager::core::v1::Summary;
using transcription::providers::ProviderOutput;
using transcription::providers::TranscribeResult;

namespace model = transcription::model;

class FakeProvider final : public transcription::providers::TranscriptionProvider {
 public:
  explicit FakeProvider(std::string name) : name_(std::move(name)) {
  }

  std::string Name() const override {
    return name_;
  }

  TranscribeResult Transcribe(const std::filesystem::path& audio_path, const std::string& language) override {
    ++calls;
    last_language = language;
    seen_audio    = std::filesystem::exists(audio_path);
    last_audio    = audio_path;
    if (fail_with_parse_error) {
      return TranscribeResult::ParseFailure("bad timestamp");
    }
    if (!failure.empty()) {
      return TranscribeResult::Failure(failure);
    }

    ProviderOutput output;
    output.kind = ProviderOutput::Kind::kTokens;
    for (const auto& [text, speaker] : std::vector<std::pair<std::string, std::string>>{{"Hello.", "A"}, {"Bye.", "B"}}) {
      model::Word word;
      word.text    = text;
      word.speaker = speaker;
      word.start   = static_cast<double>(output.tokens.size());
      word.end     = word.start + 0.5;
      output.tokens.push_back(word);
    }
    return TranscribeResult::Success(std::move(output));
  }

  int                   calls = 0;
  std::string           last_language;
  bool                  seen_audio = false;
  std::filesystem::path last_audio;
  std::string           failure;
  bool                  fail_with_parse_error = false;

 private:
  std::string name_;
};

class FakeSummarizer final : public transcription::providers::Summarizer {
 public:
  Summary Summarize(const std::vector<model::Segment>& segments) override {
    ++calls;
    Summary summary;
    summary.set_overview("segments=" + std::to_string(segments.size()));
    auto* point = summary.add_summary_points();
    point->set_text("first");
    point->set_timestamp(segments.front().start);
    return summary;
  }

  int calls = 0;
};

class FakeYoutube final : public transcription::sources::YoutubeSource {
 public:
  transcription::sources::DownloadedAudio Download(const std::string& video_id, const std::filesystem::path& workdir) const override {
    ++downloads;
    transcription::sources::DownloadedAudio audio;
    audio.path      = workdir / (video_id + ".m4a");
    audio.title     = "Video " + video_id;
    audio.mime_type = "audio/mp4";
    std::ofstream(audio.path, std::ios::binary) << "m4a-bytes-" << video_id;
    return audio;
  }

  mutable int downloads = 0;
};

// Delegates to a MemoryRepository; refuses writes that would complete a job.
class RejectingCompletionRepository final : public transcription::db::Repository {
 public:
  explicit RejectingCompletionRepository(std::shared_ptr<transcription::db::Repository> inner) : inner_(std::move(inner)) {
  }

  std::unique_ptr<transcription::db::Transaction> Begin() override {
    return inner_->Begin();
  }
  transcription::db::Result InsertAsset(transcription::db::Transaction& tx, const transcription::db::model::AssetRecord& asset) override {
    return inner_->InsertAsset(tx, asset);
  }
  std::optional<transcription::db::model::AssetRecord> GetAsset(transcription::db::Transaction& tx, const std::string& id) override {
    return inner_->GetAsset(tx, id);
  }
  std::optional<transcription::db::model::AssetRecord> FindAssetByKey(transcription::db::Transaction& tx, const std::string& key_namespace,
                                                                      const std::string& content_key) override {
    return inner_->FindAssetByKey(tx, key_namespace, content_key);
  }
  transcription::db::Result DeleteAsset(transcription::db::Transaction& tx, const std::string& id) override {
    return inner_->DeleteAsset(tx, id);
  }
  transcription::db::Result InsertJob(transcription::db::Transaction& tx, const transcription::db::model::JobRecord& job) override {
    return inner_->InsertJob(tx, job);
  }
  std::optional<transcription::db::model::JobRecord> GetJob(transcription::db::Transaction& tx, const std::string& id) override {
    return inner_->GetJob(tx, id);
  }
  transcription::db::Result UpdateJob(transcription::db::Transaction& tx, const transcription::db::model::JobRecord& job) override {
    if (job.status == JOB_STATUS_COMPLETED) {
      ++rejected;
      return transcription::db::Result::Err(transcription::db::ErrorCode::IOError, "disk full");
    }
    return inner_->UpdateJob(tx, job);
  }
  transcription::db::Result DeleteJob(transcription::db::Transaction& tx, const std::string& id) override {
    return inner_->DeleteJob(tx, id);
  }
  std::vector<transcription::db::model::JobRecord> FindJobsByKey(transcription::db::Transaction& tx, const std::string& asset_id,
                                                                 const std::string& provider, const std::string& language) override {
    return inner_->FindJobsByKey(tx, asset_id, provider, language);
  }
  uint64_t CountJobsForAsset(transcription::db::Transaction& tx, const std::string& asset_id) override {
    return inner_->CountJobsForAsset(tx, asset_id);
  }
  std::vector<transcription::db::model::JobRecord> ListJobsByOwner(transcription::db::Transaction& tx, const std::string& owner) override {
    return inner_->ListJobsByOwner(tx, owner);
  }
  std::vector<transcription::db::model::JobRecord> ListJobsByStatus(transcription::db::Transaction& tx, model::JobStatus status) override {
    return inner_->ListJobsByStatus(tx, status);
  }

  int rejected = 0;

 private:
  std::shared_ptr<transcription::db::Repository> inner_;
};

struct Fixture {
  std::filesystem::path                                        root;
  std::shared_ptr<transcription::db::memory::MemoryRepository> repository;
  std::shared_ptr<transcription::storage::DiskMediaStore>      store;
  std::shared_ptr<transcription::media::MediaRegistry>         registry;
  std::shared_ptr<FakeProvider>                                provider;
  std::shared_ptr<FakeProvider>                                other_provider;
  std::shared_ptr<FakeSummarizer>                              summarizer;
  std::shared_ptr<FakeYoutube>                                 youtube;
  std::shared_ptr<transcription::jobs::JobQueue>               queue;
  std::shared_ptr<TranscriptionManager>                        manager;
};

Fixture MakeFixture(const std::string& name, std::shared_ptr<transcription::db::Repository> repository = nullptr) {
  Fixture f;
  f.root = std::filesystem::temp_directory_path() / "transcription_manager_tests" / name;
  std::filesystem::remove_all(f.root);
  std::filesystem::create_directories(f.root / "tmp");

  f.repository     = std::make_shared<transcription::db::memory::MemoryRepository>();
  f.store          = std::make_shared<transcription::storage::DiskMediaStore>(f.root / "media");
  if (!repository) {
    repository = f.repository;
  }
  f.registry       = std::make_shared<transcription::media::MediaRegistry>(repository, f.store);
  f.provider       = std::make_shared<FakeProvider>("elevenlabs");
  f.other_provider = std::make_shared<FakeProvider>("google");
  f.summarizer     = std::make_shared<FakeSummarizer>();
  f.youtube        = std::make_shared<FakeYoutube>();
  f.queue          = std::make_shared<transcription::jobs::JobQueue>();

  auto providers = std::make_shared<transcription::providers::ProviderContext>(200);
  providers->Register(f.provider);
  providers->Register(f.other_provider);
  providers->SetSummarizer(f.summarizer);

  transcription::core::ManagerOptions options;
  options.temp_root = f.root / "tmp";
  f.manager         = std::make_shared<TranscriptionManager>(repository, f.registry, providers, f.queue, f.youtube, options);
  return f;
}

UploadRef Upload(const std::string& content, const std::string& name = "talk.mp3") {
  return UploadRef{name, "audio/mpeg", content};
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestSubmitCreatesPendingJobAndQueuesIt() {
  auto f = MakeFixture("create");

  const auto result = f.manager->Submit(Upload("bytes-1"), "elevenlabs", "", "alice");
  assert(result.disposition == SUBMIT_DISPOSITION_CREATED);
  assert(result.job.status == JOB_STATUS_PENDING);
  assert(result.job.language == "auto");
  assert(result.job.owner == "alice");
  assert(f.queue->Depth() == 1);
  assert(f.store->Contains(result.job.asset_id));
}

void TestDuplicateSubmitWhileLiveReturnsSameJob() {
  auto f = MakeFixture("in_progress");

  const auto first  = f.manager->Submit(Upload("same-bytes", "a.mp3"), "elevenlabs", "en", "");
  const auto second = f.manager->Submit(Upload("same-bytes", "renamed.mp3"), "elevenlabs", "en", "");

  assert(second.disposition == SUBMIT_DISPOSITION_IN_PROGRESS);
  assert(second.job.id == first.job.id);
  assert(f.queue->Depth() == 1);
}

void TestCompletedJobIsServedFromCache() {
  auto f = MakeFixture("cached");

  const auto first = f.manager->Submit(Upload("cache-me"), "elevenlabs", "en", "");
  f.manager->ExecuteJob(first.job.id);

  const auto done = f.manager->Status(first.job.id);
  assert(done.status == JOB_STATUS_COMPLETED);
  assert(f.provider->calls == 1);
  assert(f.provider->seen_audio);
  assert(!std::filesystem::exists(f.provider->last_audio));

  const auto transcript = transcription::segments::DecodeTranscript(done.transcript_json);
  assert(transcript.segments.size() == 2);
  assert(transcript.segments[0].speaker == "A");
  assert(transcript.detected_language == "en");

  const auto again = f.manager->Submit(Upload("cache-me"), "elevenlabs", "en", "");
  assert(again.disposition == SUBMIT_DISPOSITION_CACHED);
  assert(again.job.id == first.job.id);
  assert(f.provider->calls == 1);
}

void TestDedupKeyIncludesProviderAndLanguage() {
  auto f = MakeFixture("key");

  const auto base          = f.manager->Submit(Upload("keyed"), "elevenlabs", "en", "");
  const auto other_lang    = f.manager->Submit(Upload("keyed"), "elevenlabs", "fr", "");
  const auto other_service = f.manager->Submit(Upload("keyed"), "google", "en", "");

  assert(other_lang.disposition == SUBMIT_DISPOSITION_CREATED);
  assert(other_service.disposition == SUBMIT_DISPOSITION_CREATED);
  assert(other_lang.job.asset_id == base.job.asset_id);
  assert(other_service.job.asset_id == base.job.asset_id);
  assert(other_lang.job.id != base.job.id);
}

void TestProviderFailureMarksJobFailed() {
  auto f = MakeFixture("failure");
  f.provider->failure = "elevenlabs: HTTP 500";

  const auto result = f.manager->Submit(Upload("doomed"), "elevenlabs", "en", "");
  f.manager->ExecuteJob(result.job.id);

  const auto job = f.manager->Status(result.job.id);
  assert(job.status == JOB_STATUS_FAILED);
  assert(job.error_message == "elevenlabs: HTTP 500");
  assert(job.transcript_json.empty());

  // a failed job does not block a new attempt
  f.provider->failure.clear();
  const auto retry = f.manager->Submit(Upload("doomed"), "elevenlabs", "en", "");
  assert(retry.disposition == SUBMIT_DISPOSITION_CREATED);
  assert(retry.job.id != result.job.id);
}

void TestParseFailureIsRecordedWithPrefix() {
  auto f = MakeFixture("parse_failure");
  f.provider->fail_with_parse_error = true;

  const auto result = f.manager->Submit(Upload("garbled"), "elevenlabs", "en", "");
  f.manager->ExecuteJob(result.job.id);

  const auto job = f.manager->Status(result.job.id);
  assert(job.status == JOB_STATUS_FAILED);
  assert(job.error_message == "parse error: bad timestamp");
}

void TestUnrecordableResultMarksJobFailed() {
  auto memory    = std::make_shared<transcription::db::memory::MemoryRepository>();
  auto rejecting = std::make_shared<RejectingCompletionRepository>(memory);
  auto f         = MakeFixture("unrecordable", rejecting);

  const auto result = f.manager->Submit(Upload("lost-result"), "elevenlabs", "en", "");
  f.manager->ExecuteJob(result.job.id);

  assert(rejecting->rejected == 1);
  const auto job = f.manager->Status(result.job.id);
  assert(job.status == JOB_STATUS_FAILED);
  assert(job.transcript_json.empty());
  assert(job.error_message.find("could not record result") == 0);
  assert(job.error_message.find("disk full") != std::string::npos);

  // the dedup key is free again
  const auto retry = f.manager->Submit(Upload("lost-result"), "elevenlabs", "en", "");
  assert(retry.disposition == SUBMIT_DISPOSITION_CREATED);
  assert(retry.job.id != result.job.id);
}

void TestExecuteIgnoresFinishedJobs() {
  auto f = MakeFixture("at_most_once");

  const auto result = f.manager->Submit(Upload("once"), "elevenlabs", "en", "");
  f.manager->ExecuteJob(result.job.id);
  f.manager->ExecuteJob(result.job.id);
  f.manager->ExecuteJob("no-such-job");

  assert(f.provider->calls == 1);
}

void TestRegenerateBypassesCache() {
  auto f = MakeFixture("regenerate");

  const auto first = f.manager->Submit(Upload("regen"), "elevenlabs", "en", "bob");
  f.manager->ExecuteJob(first.job.id);

  const auto regen = f.manager->Regenerate(first.job.id, "", "", "bob");
  assert(regen.disposition == SUBMIT_DISPOSITION_CREATED);
  assert(regen.job.id != first.job.id);
  assert(regen.job.asset_id == first.job.asset_id);
  assert(regen.job.provider == "elevenlabs");
  assert(regen.job.language == "en");

  const auto while_live = f.manager->Regenerate(first.job.id, "", "", "bob");
  assert(while_live.disposition == SUBMIT_DISPOSITION_IN_PROGRESS);
  assert(while_live.job.id == regen.job.id);

  const auto switched = f.manager->Regenerate(first.job.id, "google", "vi", "bob");
  assert(switched.job.provider == "google");
  assert(switched.job.language == "vi");

  assert(Throws<transcription::util::PermissionDenied>([&] { f.manager->Regenerate(first.job.id, "", "", "mallory"); }));
}

void TestDeleteRemovesAssetWithLastJob() {
  auto f = MakeFixture("delete");

  const auto en = f.manager->Submit(Upload("shared"), "elevenlabs", "en", "carol");
  const auto fr = f.manager->Submit(Upload("shared"), "elevenlabs", "fr", "carol");

  assert(Throws<transcription::util::PermissionDenied>([&] { f.manager->Delete(en.job.id, "dave"); }));

  f.manager->Delete(en.job.id, "carol");
  assert(Throws<transcription::util::NotFound>([&] { f.manager->Status(en.job.id); }));
  assert(f.registry->Get(en.job.asset_id).has_value());
  assert(f.store->Contains(en.job.asset_id));

  f.manager->Delete(fr.job.id, "carol");
  assert(!f.registry->Get(fr.job.asset_id).has_value());
  assert(!f.store->Contains(fr.job.asset_id));

  // a queued id whose row is gone is skipped
  f.manager->ExecuteJob(en.job.id);
  assert(f.provider->calls == 0);
}

void TestListJobsFiltersByOwner() {
  auto f = MakeFixture("list");

  f.manager->Submit(Upload("one", "one.mp3"), "elevenlabs", "en", "erin");
  f.manager->Submit(Upload("two", "two.wav"), "google", "en", "erin");
  f.manager->Submit(Upload("three"), "elevenlabs", "en", "frank");

  const auto jobs = f.manager->ListJobs("erin");
  assert(jobs.size() == 2);
  for (const auto& entry : jobs) {
    assert(entry.job.owner == "erin");
    assert(entry.asset.id == entry.job.asset_id);
  }
  // newest first
  assert(jobs.front().asset.display_name == "two.wav");
}

void TestYoutubeSubmitDownloadsOnce() {
  auto f = MakeFixture("youtube");

  const auto first = f.manager->Submit(YoutubeRef{"https://www.youtube.com/watch?v=dQw4w9WgXcQ"}, "elevenlabs", "en", "");
  assert(first.disposition == SUBMIT_DISPOSITION_CREATED);
  assert(f.youtube->downloads == 1);

  const auto asset = f.registry->Get(first.job.asset_id);
  assert(asset.has_value());
  assert(asset->key_namespace == "youtube");
  assert(asset->content_key == "dQw4w9WgXcQ");
  assert(asset->display_name == "Video dQw4w9WgXcQ");

  const auto second = f.manager->Submit(YoutubeRef{"https://youtu.be/dQw4w9WgXcQ"}, "google", "en", "");
  assert(second.job.asset_id == first.job.asset_id);
  assert(f.youtube->downloads == 1);

  assert(Throws<transcription::util::ValidationError>([&] { f.manager->Submit(YoutubeRef{"https://vimeo.com/123"}, "elevenlabs", "en", ""); }));
}

void TestSubmitValidatesInput() {
  auto f = MakeFixture("validation");

  assert(Throws<transcription::util::ValidationError>([&] { f.manager->Submit(Upload("x"), "", "en", ""); }));
  assert(Throws<transcription::util::ValidationError>([&] { f.manager->Submit(Upload("x"), "nope", "en", ""); }));
  assert(Throws<transcription::util::ValidationError>([&] { f.manager->Submit(Upload(""), "elevenlabs", "en", ""); }));
  assert(f.queue->Depth() == 0);
}

void TestSummarizeCachesResult() {
  auto f = MakeFixture("summarize");

  const auto result = f.manager->Submit(Upload("summary"), "elevenlabs", "en", "");
  assert(Throws<transcription::util::InvalidState>([&] { f.manager->Summarize(result.job.id); }));

  f.manager->ExecuteJob(result.job.id);

  const auto summary = f.manager->Summarize(result.job.id);
  assert(summary.overview() == "segments=2");
  assert(f.summarizer->calls == 1);

  const auto cached = f.manager->Summarize(result.job.id);
  assert(cached.overview() == "segments=2");
  assert(f.summarizer->calls == 1);
  assert(!f.manager->Status(result.job.id).summary_json.empty());
}

void TestRecoveryRequeuesPendingAndFailsInterrupted() {
  auto f = MakeFixture("recovery");

  const auto pending    = f.manager->Submit(Upload("pending"), "elevenlabs", "en", "");
  const auto processing = f.manager->Submit(Upload("processing"), "elevenlabs", "en", "");

  {
    auto tx  = f.repository->Begin();
    auto job = f.repository->GetJob(*tx, processing.job.id);
    job->status        = JOB_STATUS_PROCESSING;
    const auto updated = f.repository->UpdateJob(*tx, *job);
    assert(updated);
    tx->Commit();
  }

  auto fresh_queue = std::make_shared<transcription::jobs::JobQueue>();
  auto providers   = std::make_shared<transcription::providers::ProviderContext>(200);
  providers->Register(f.provider);
  TranscriptionManager restarted(f.repository, f.registry, providers, fresh_queue, f.youtube);

  const auto stats = restarted.RecoverOnStartup();
  assert(stats.requeued == 1);
  assert(stats.interrupted == 1);
  assert(fresh_queue->Depth() == 1);

  const auto interrupted = restarted.Status(processing.job.id);
  assert(interrupted.status == JOB_STATUS_FAILED);
  assert(!interrupted.error_message.empty());
  assert(restarted.Status(pending.job.id).status == JOB_STATUS_PENDING);
}

} // namespace

int main() {
  TestSubmitCreatesPendingJobAndQueuesIt();
  TestDuplicateSubmitWhileLiveReturnsSameJob();
  TestCompletedJobIsServedFromCache();
  TestDedupKeyIncludesProviderAndLanguage();
  TestProviderFailureMarksJobFailed();
  TestParseFailureIsRecordedWithPrefix();
  TestUnrecordableResultMarksJobFailed();
  TestExecuteIgnoresFinishedJobs();
  TestRegenerateBypassesCache();
  TestDeleteRemovesAssetWithLastJob();
  TestListJobsFiltersByOwner();
  TestYoutubeSubmitDownloadsOnce();
  TestSubmitValidatesInput();
  TestSummarizeCachesResult();
  TestRecoveryRequeuesPendingAndFailsInterrupted();

  std::cout << "transcription_unit_transcription_manager: pass\n";
  return 0;
}

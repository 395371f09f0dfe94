#include "internal/service/transcription_service.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/segments/segment_codec.hpp"
#include "internal/storage/disk/disk_media_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace transcription::manager::v1;
using transcription::providers::ProviderOutput;
using transcription::providers::TranscribeResult;

class TwoSpeakerProvider final : public transcription::providers::TranscriptionProvider {
 public:
  std::string Name() const override {
    return "elevenlabs";
  }

  TranscribeResult Transcribe(const std::filesystem::path&, const std::string&) override {
    ProviderOutput output;
    output.detected_language = "en";

    transcription::model::Word hello;
    hello.text    = "Hello there.";
    hello.speaker = "speaker_0";
    hello.start   = 0.0;
    hello.end     = 1.5;
    output.tokens.push_back(hello);

    transcription::model::Word reply;
    reply.text    = "Hi.";
    reply.speaker = "speaker_1";
    reply.start   = 1.5;
    reply.end     = 2.0;
    output.tokens.push_back(reply);
    return TranscribeResult::Success(std::move(output));
  }
};

class StubYoutube final : public transcription::sources::YoutubeSource {
 public:
  transcription::sources::DownloadedAudio Download(const std::string& video_id, const std::filesystem::path& workdir) const override {
    transcription::sources::DownloadedAudio audio;
    audio.path      = workdir / (video_id + ".m4a");
    audio.title     = "Some video";
    audio.mime_type = "audio/mp4";
    std::ofstream(audio.path, std::ios::binary) << "m4a";
    return audio;
  }
};

struct Fixture {
  std::shared_ptr<transcription::core::TranscriptionManager>   manager;
  std::unique_ptr<transcription::service::TranscriptionService> service;
};

Fixture MakeFixture(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "transcription_service_tests" / name;
  std::filesystem::remove_all(root);

  auto repository = std::make_shared<transcription::db::memory::MemoryRepository>();
  auto store      = std::make_shared<transcription::storage::DiskMediaStore>(root / "media");
  auto registry   = std::make_shared<transcription::media::MediaRegistry>(repository, store);
  auto providers  = std::make_shared<transcription::providers::ProviderContext>(200);
  providers->Register(std::make_shared<TwoSpeakerProvider>());

  transcription::core::ManagerOptions options;
  options.temp_root = root / "tmp";

  Fixture f;
  f.manager = std::make_shared<transcription::core::TranscriptionManager>(repository, registry, providers, std::make_shared<transcription::jobs::JobQueue>(),
                                                                          std::make_shared<StubYoutube>(), options);
  transcription::service::ServiceContext ctx;
  ctx.manager = f.manager;
  f.service   = std::make_unique<transcription::service::TranscriptionService>(ctx);
  return f;
}

void TestJobViewOfCompletedRow() {
  transcription::model::Segment segment;
  segment.start   = 0.25;
  segment.end     = 1.5;
  segment.text    = "Hello there.";
  segment.speaker = "speaker_0";

  transcription::model::Transcript transcript;
  transcript.segments.push_back(segment);
  transcript.detected_language = "en";

  Summary summary;
  summary.set_overview("A greeting.");

  transcription::db::model::JobRecord job;
  job.id              = "job-1";
  job.asset_id        = "asset-1";
  job.provider        = "elevenlabs";
  job.language        = "auto";
  job.status          = JOB_STATUS_COMPLETED;
  job.transcript_json = transcription::segments::EncodeTranscript(transcript);
  job.summary_json    = transcription::segments::EncodeSummary(summary);
  job.created_at_ms   = 1700000000123;

  const auto view = transcription::service::ToJobView(job);
  assert(view.job_id() == "job-1");
  assert(view.status() == JOB_STATUS_COMPLETED);
  assert(view.segments_size() == 1);
  assert(view.segments(0).speaker() == "speaker_0");
  assert(view.segments(0).start() == 0.25);
  assert(view.detected_language() == "en");
  assert(view.summary().overview() == "A greeting.");
  assert(view.created_at().seconds() == 1700000000);
  assert(view.created_at().nanos() == 123000000);
}

void TestJobViewOfFailedRow() {
  transcription::db::model::JobRecord job;
  job.id            = "job-2";
  job.status        = JOB_STATUS_FAILED;
  job.error_message = "HTTP 500";

  const auto view = transcription::service::ToJobView(job);
  assert(view.segments_size() == 0);
  assert(!view.has_summary());
  assert(view.error_message() == "HTTP 500");
}

void TestSubmitRequiresSource() {
  auto f = MakeFixture("no_source");

  SubmitRequest req;
  req.set_provider("elevenlabs");

  bool threw = false;
  try {
    (void)f.service->Submit(req);
  } catch (const transcription::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestSubmitExecuteAndFetch() {
  auto f = MakeFixture("roundtrip");

  SubmitRequest req;
  req.mutable_upload()->set_file_name("meeting.wav");
  req.mutable_upload()->set_content("RIFF-meeting");
  req.set_provider("elevenlabs");

  const auto submitted = f.service->Submit(req);
  assert(submitted.disposition() == SUBMIT_DISPOSITION_CREATED);
  assert(submitted.job().status() == JOB_STATUS_PENDING);
  assert(submitted.job().language() == "auto");

  f.manager->ExecuteJob(submitted.job().job_id());

  GetStatusRequest status_req;
  status_req.set_job_id(submitted.job().job_id());
  const auto status = f.service->GetStatus(status_req);
  assert(status.job().status() == JOB_STATUS_COMPLETED);
  assert(status.job().segments_size() == 2);
  assert(status.job().segments(1).speaker() == "speaker_1");
  assert(status.job().detected_language() == "en");

  const auto again = f.service->Submit(req);
  assert(again.disposition() == SUBMIT_DISPOSITION_CACHED);
  assert(again.job().job_id() == submitted.job().job_id());
}

void TestListJobsMarksYoutubeAssets() {
  auto f = MakeFixture("list");

  SubmitRequest upload;
  upload.mutable_upload()->set_file_name("meeting.wav");
  upload.mutable_upload()->set_content("RIFF-meeting");
  upload.set_provider("elevenlabs");
  upload.set_owner("alice");
  (void)f.service->Submit(upload);

  SubmitRequest video;
  video.set_youtube_url("https://youtu.be/dQw4w9WgXcQ");
  video.set_provider("elevenlabs");
  video.set_owner("alice");
  (void)f.service->Submit(video);

  ListJobsRequest req;
  req.set_owner("alice");
  const auto resp = f.service->ListJobs(req);
  assert(resp.jobs_size() == 2);

  int youtube = 0;
  for (const auto& row : resp.jobs()) {
    if (row.is_youtube()) {
      ++youtube;
      assert(row.file_name() == "Some video");
      assert(row.mime_type() == "audio/mp4");
    } else {
      assert(row.file_name() == "meeting.wav");
      assert(row.mime_type() == "audio/wav");
    }
    assert(!row.has_summary());
    assert(row.status() == JOB_STATUS_PENDING);
  }
  assert(youtube == 1);

  ListJobsRequest other;
  other.set_owner("bob");
  assert(f.service->ListJobs(other).jobs_size() == 0);
}

} // namespace

int main() {
  TestJobViewOfCompletedRow();
  TestJobViewOfFailedRow();
  TestSubmitRequiresSource();
  TestSubmitExecuteAndFetch();
  TestListJobsMarksYoutubeAssets();

  std::cout << "transcription_unit_transcription_service: pass\n";
  return 0;
}

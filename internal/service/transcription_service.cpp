#include "transcription_service.hpp"

#include <google/protobuf/util/time_util.h>

#include <chrono>
#include <type_traits>

#include "internal/db/model/asset_record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/segments/segment_codec.hpp"
#include "internal/util/errors.hpp"

namespace transcription::service {

using namespace transcription::manager::v1;
using google::protobuf::util::TimeUtil;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string* job_id, Fn&& fn) {
  transcription::observability::SpanScope span(route);
  if (job_id && !job_id->empty()) {
    span.SetAttribute("job.id", *job_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      transcription::observability::Metrics::Instance().RecordRequest(route, true);
      transcription::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      transcription::observability::Metrics::Instance().RecordRequest(route, true);
      transcription::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    TRANSCRIPTION_LOG_ERROR("RPC failed", {transcription::observability::StringField("route", route), transcription::observability::StringField("error", ex.what()),
                                           transcription::observability::StringField("job_id", job_id ? *job_id : std::string())});
    transcription::observability::Metrics::Instance().RecordRequest(route, false);
    transcription::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

core::AssetRef ToAssetRef(const SubmitRequest& req) {
  switch (req.source_case()) {
    case SubmitRequest::kUpload:
      return core::UploadRef{req.upload().file_name(), req.upload().mime_type(), req.upload().content()};
    case SubmitRequest::kYoutubeUrl:
      return core::YoutubeRef{req.youtube_url()};
    case SubmitRequest::SOURCE_NOT_SET:
      break;
  }
  throw transcription::util::ValidationError("submit: either upload or youtube_url is required");
}

} // namespace

JobView ToJobView(const db::model::JobRecord& job) {
  JobView view;
  view.set_job_id(job.id);
  view.set_asset_id(job.asset_id);
  view.set_provider(job.provider);
  view.set_language(job.language);
  view.set_status(job.status);
  view.set_error_message(job.error_message);
  *view.mutable_created_at() = TimeUtil::MillisecondsToTimestamp(static_cast<int64_t>(job.created_at_ms));

  if (!job.transcript_json.empty()) {
    const auto transcript = segments::DecodeTranscript(job.transcript_json);
    for (const auto& segment : transcript.segments) {
      *view.add_segments() = segments::ToProto(segment);
    }
    view.set_detected_language(transcript.detected_language);
  }
  if (!job.summary_json.empty()) {
    *view.mutable_summary() = segments::DecodeSummary(job.summary_json);
  }
  return view;
}

TranscriptionService::TranscriptionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitResponse TranscriptionService::Submit(const SubmitRequest& req) {
  return ObserveRpc("TranscriptionService.Submit", nullptr, [&] {
    auto result = ctx_.manager->Submit(ToAssetRef(req), req.provider(), req.language(), req.owner());

    SubmitResponse resp;
    *resp.mutable_job() = ToJobView(result.job);
    resp.set_disposition(result.disposition);
    return resp;
  });
}

GetStatusResponse TranscriptionService::GetStatus(const GetStatusRequest& req) {
  return ObserveRpc("TranscriptionService.GetStatus", &req.job_id(), [&] {
    GetStatusResponse resp;
    *resp.mutable_job() = ToJobView(ctx_.manager->Status(req.job_id()));
    return resp;
  });
}

RegenerateResponse TranscriptionService::Regenerate(const RegenerateRequest& req) {
  return ObserveRpc("TranscriptionService.Regenerate", &req.job_id(), [&] {
    auto result = ctx_.manager->Regenerate(req.job_id(), req.provider(), req.language(), req.owner());

    RegenerateResponse resp;
    *resp.mutable_job() = ToJobView(result.job);
    resp.set_disposition(result.disposition);
    return resp;
  });
}

void TranscriptionService::Delete(const DeleteRequest& req) {
  ObserveRpc("TranscriptionService.Delete", &req.job_id(), [&] { ctx_.manager->Delete(req.job_id(), req.owner()); });
}

ListJobsResponse TranscriptionService::ListJobs(const ListJobsRequest& req) {
  return ObserveRpc("TranscriptionService.ListJobs", nullptr, [&] {
    ListJobsResponse resp;
    for (const auto& entry : ctx_.manager->ListJobs(req.owner())) {
      auto* row = resp.add_jobs();
      row->set_job_id(entry.job.id);
      row->set_asset_id(entry.asset.id);
      row->set_file_name(entry.asset.display_name);
      row->set_mime_type(entry.asset.mime_type);
      *row->mutable_created_at() = TimeUtil::MillisecondsToTimestamp(static_cast<int64_t>(entry.job.created_at_ms));
      row->set_provider(entry.job.provider);
      row->set_language(entry.job.language);
      row->set_status(entry.job.status);
      row->set_has_summary(!entry.job.summary_json.empty());
      row->set_is_youtube(entry.asset.key_namespace == db::model::kYoutubeNamespace);
    }
    return resp;
  });
}

SummarizeResponse TranscriptionService::Summarize(const SummarizeRequest& req) {
  return ObserveRpc("TranscriptionService.Summarize", &req.job_id(), [&] {
    SummarizeResponse resp;
    *resp.mutable_summary() = ctx_.manager->Summarize(req.job_id());
    return resp;
  });
}

} // namespace transcription::service

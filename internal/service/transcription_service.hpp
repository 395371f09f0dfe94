#pragma once

#include "service_context.hpp"
#include "internal/core/transcription_manager.hpp"
#include "transcription/manager/v1.hpp"

namespace transcription::service {

// Row -> wire view. Transcript and summary JSON are decoded when present.
transcription::manager::v1::JobView ToJobView(const db::model::JobRecord& job);

class TranscriptionService {
 public:
  explicit TranscriptionService(ServiceContext ctx);

  transcription::manager::v1::SubmitResponse Submit(const transcription::manager::v1::SubmitRequest& req);

  transcription::manager::v1::GetStatusResponse GetStatus(const transcription::manager::v1::GetStatusRequest& req);

  transcription::manager::v1::RegenerateResponse Regenerate(const transcription::manager::v1::RegenerateRequest& req);

  void Delete(const transcription::manager::v1::DeleteRequest& req);

  transcription::manager::v1::ListJobsResponse ListJobs(const transcription::manager::v1::ListJobsRequest& req);

  transcription::manager::v1::SummarizeResponse Summarize(const transcription::manager::v1::SummarizeRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace transcription::service

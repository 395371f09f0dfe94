#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "transcription/manager/services/v1/transcription_service.grpc.pb.h"
#include "transcription/manager/v1.hpp"

namespace transcription::manager::client {

class TranscriptionClient {
 public:
  explicit TranscriptionClient(std::shared_ptr<grpc::Channel> channel);

  // reads the file and sends it inline; the server guesses an empty mime type from the file name
  arrow::Result<transcription::manager::v1::SubmitResponse> SubmitFile(const std::filesystem::path& path, const std::string& provider,
                                                                       const std::string& language, const std::string& owner = "",
                                                                       const std::string& mime_type = "") const;

  arrow::Result<transcription::manager::v1::SubmitResponse> SubmitYoutube(const std::string& url, const std::string& provider,
                                                                          const std::string& language, const std::string& owner = "") const;

  arrow::Result<transcription::manager::v1::JobView> GetStatus(const std::string& job_id) const;

  /*
    Polls GetStatus until the job reaches COMPLETED or FAILED. A timeout of
    zero waits forever.
  */
  arrow::Result<transcription::manager::v1::JobView> WaitForCompletion(const std::string& job_id, std::chrono::milliseconds poll_interval,
                                                                       std::chrono::milliseconds timeout) const;

  arrow::Result<transcription::manager::v1::RegenerateResponse> Regenerate(const transcription::manager::v1::RegenerateRequest& request) const;

  arrow::Status Delete(const std::string& job_id, const std::string& owner = "") const;

  arrow::Result<transcription::manager::v1::ListJobsResponse> ListJobs(const std::string& owner = "") const;

  arrow::Result<transcription::manager::v1::Summary> Summarize(const std::string& job_id) const;

 private:
  arrow::Result<transcription::manager::v1::SubmitResponse> Submit(const transcription::manager::v1::SubmitRequest& request) const;

  std::unique_ptr<transcription::manager::v1::TranscriptionService::Stub> stub_;
};

} // namespace transcription::manager::client

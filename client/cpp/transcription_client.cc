#include "client/cpp/transcription_client.h"

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <grpcpp/client_context.h>

#include <string_view>
#include <thread>

namespace transcription::manager::client {

namespace {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
}

bool IsTerminal(transcription::manager::v1::JobStatus status) {
  return status == transcription::manager::v1::JOB_STATUS_COMPLETED || status == transcription::manager::v1::JOB_STATUS_FAILED;
}

} // namespace

TranscriptionClient::TranscriptionClient(std::shared_ptr<grpc::Channel> channel)
    : stub_(transcription::manager::v1::TranscriptionService::NewStub(std::move(channel))) {
}

arrow::Result<transcription::manager::v1::SubmitResponse> TranscriptionClient::Submit(const transcription::manager::v1::SubmitRequest& request) const {
  transcription::manager::v1::SubmitResponse response;
  grpc::ClientContext                        ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Submit(&ctx, request, &response), "Submit"));
  return response;
}

arrow::Result<transcription::manager::v1::SubmitResponse> TranscriptionClient::SubmitFile(const std::filesystem::path& path, const std::string& provider,
                                                                                          const std::string& language, const std::string& owner,
                                                                                          const std::string& mime_type) const {
  ARROW_ASSIGN_OR_RAISE(auto file, arrow::io::ReadableFile::Open(path.string()));
  ARROW_ASSIGN_OR_RAISE(auto size, file->GetSize());
  ARROW_ASSIGN_OR_RAISE(auto buffer, file->Read(size));
  ARROW_RETURN_NOT_OK(file->Close());

  transcription::manager::v1::SubmitRequest request;
  auto*                                     upload = request.mutable_upload();
  upload->set_file_name(path.filename().string());
  upload->set_mime_type(mime_type);
  upload->set_content(buffer->ToString());
  request.set_provider(provider);
  request.set_language(language);
  request.set_owner(owner);
  return Submit(request);
}

arrow::Result<transcription::manager::v1::SubmitResponse> TranscriptionClient::SubmitYoutube(const std::string& url, const std::string& provider,
                                                                                             const std::string& language, const std::string& owner) const {
  transcription::manager::v1::SubmitRequest request;
  request.set_youtube_url(url);
  request.set_provider(provider);
  request.set_language(language);
  request.set_owner(owner);
  return Submit(request);
}

arrow::Result<transcription::manager::v1::JobView> TranscriptionClient::GetStatus(const std::string& job_id) const {
  transcription::manager::v1::GetStatusRequest request;
  request.set_job_id(job_id);

  transcription::manager::v1::GetStatusResponse response;
  grpc::ClientContext                           ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->GetStatus(&ctx, request, &response), "GetStatus"));
  return response.job();
}

arrow::Result<transcription::manager::v1::JobView> TranscriptionClient::WaitForCompletion(const std::string& job_id, std::chrono::milliseconds poll_interval,
                                                                                          std::chrono::milliseconds timeout) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    ARROW_ASSIGN_OR_RAISE(auto job, GetStatus(job_id));
    if (IsTerminal(job.status())) {
      return job;
    }
    if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
      return arrow::Status::IOError("timed out waiting for job ", job_id);
    }
    std::this_thread::sleep_for(poll_interval);
  }
}

arrow::Result<transcription::manager::v1::RegenerateResponse> TranscriptionClient::Regenerate(
    const transcription::manager::v1::RegenerateRequest& request) const {
  transcription::manager::v1::RegenerateResponse response;
  grpc::ClientContext                            ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Regenerate(&ctx, request, &response), "Regenerate"));
  return response;
}

arrow::Status TranscriptionClient::Delete(const std::string& job_id, const std::string& owner) const {
  transcription::manager::v1::DeleteRequest request;
  request.set_job_id(job_id);
  request.set_owner(owner);

  google::protobuf::Empty response;
  grpc::ClientContext     ctx;

  return GrpcToArrow(stub_->Delete(&ctx, request, &response), "Delete");
}

arrow::Result<transcription::manager::v1::ListJobsResponse> TranscriptionClient::ListJobs(const std::string& owner) const {
  transcription::manager::v1::ListJobsRequest request;
  request.set_owner(owner);

  transcription::manager::v1::ListJobsResponse response;
  grpc::ClientContext                          ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->ListJobs(&ctx, request, &response), "ListJobs"));
  return response;
}

arrow::Result<transcription::manager::v1::Summary> TranscriptionClient::Summarize(const std::string& job_id) const {
  transcription::manager::v1::SummarizeRequest request;
  request.set_job_id(job_id);

  transcription::manager::v1::SummarizeResponse response;
  grpc::ClientContext                           ctx;

  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Summarize(&ctx, request, &response), "Summarize"));
  return response.summary();
}

} // namespace transcription::manager::client

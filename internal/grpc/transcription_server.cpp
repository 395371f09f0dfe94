#include "transcription_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace transcription::grpc {

using namespace transcription::manager::v1;

namespace {

// runs one unary call; service exceptions become a status, and only
// server-side failures are logged
template <typename Fn>
::grpc::Status Handle(const char* method, Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    auto status = ToStatus(e);
    if (status.error_code() == ::grpc::StatusCode::INTERNAL || status.error_code() == ::grpc::StatusCode::UNAVAILABLE ||
        status.error_code() == ::grpc::StatusCode::DATA_LOSS) {
      TRANSCRIPTION_LOG_ERROR("rpc failed", {observability::StringField("method", method), observability::IntField("code", status.error_code()),
                                             observability::StringField("error", e.what())});
    }
    return status;
  }
}

} // namespace

TranscriptionServer::TranscriptionServer(std::shared_ptr<transcription::service::TranscriptionService> svc) : service_(std::move(svc)) {
}

::grpc::Status TranscriptionServer::Submit(::grpc::ServerContext*, const SubmitRequest* req, SubmitResponse* resp) {
  return Handle("Submit", [&] { *resp = service_->Submit(*req); });
}

::grpc::Status TranscriptionServer::GetStatus(::grpc::ServerContext*, const GetStatusRequest* req, GetStatusResponse* resp) {
  return Handle("GetStatus", [&] { *resp = service_->GetStatus(*req); });
}

::grpc::Status TranscriptionServer::Regenerate(::grpc::ServerContext*, const RegenerateRequest* req, RegenerateResponse* resp) {
  return Handle("Regenerate", [&] { *resp = service_->Regenerate(*req); });
}

::grpc::Status TranscriptionServer::Delete(::grpc::ServerContext*, const DeleteRequest* req, google::protobuf::Empty*) {
  return Handle("Delete", [&] { service_->Delete(*req); });
}

::grpc::Status TranscriptionServer::ListJobs(::grpc::ServerContext*, const ListJobsRequest* req, ListJobsResponse* resp) {
  return Handle("ListJobs", [&] { *resp = service_->ListJobs(*req); });
}

::grpc::Status TranscriptionServer::Summarize(::grpc::ServerContext*, const SummarizeRequest* req, SummarizeResponse* resp) {
  return Handle("Summarize", [&] { *resp = service_->Summarize(*req); });
}

} // namespace transcription::grpc

#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/transcription_service.hpp"
#include "transcription/manager/v1.hpp"

namespace transcription::grpc {

class TranscriptionServer final : public transcription::manager::v1::TranscriptionService::Service {
 public:
  explicit TranscriptionServer(std::shared_ptr<transcription::service::TranscriptionService> svc);

  ::grpc::Status Submit(::grpc::ServerContext* ctx, const transcription::manager::v1::SubmitRequest* req,
                        transcription::manager::v1::SubmitResponse* resp) override;

  ::grpc::Status GetStatus(::grpc::ServerContext* ctx, const transcription::manager::v1::GetStatusRequest* req,
                           transcription::manager::v1::GetStatusResponse* resp) override;

  ::grpc::Status Regenerate(::grpc::ServerContext* ctx, const transcription::manager::v1::RegenerateRequest* req,
                            transcription::manager::v1::RegenerateResponse* resp) override;

  ::grpc::Status Delete(::grpc::ServerContext* ctx, const transcription::manager::v1::DeleteRequest* req, google::protobuf::Empty* resp) override;

  ::grpc::Status ListJobs(::grpc::ServerContext* ctx, const transcription::manager::v1::ListJobsRequest* req,
                          transcription::manager::v1::ListJobsResponse* resp) override;

  ::grpc::Status Summarize(::grpc::ServerContext* ctx, const transcription::manager::v1::SummarizeRequest* req,
                           transcription::manager::v1::SummarizeResponse* resp) override;

 private:
  std::shared_ptr<transcription::service::TranscriptionService> service_;
};

} // namespace transcription::grpc

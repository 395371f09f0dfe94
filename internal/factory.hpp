#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/transcription_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/jobs/job_queue.hpp"
#include "internal/jobs/job_worker.hpp"

namespace transcription::factory {

/*
  Application

  Everything here lives for the lifetime of the process. The worker pool is
  started by Build; Shutdown drains it before the repository goes away.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<core::TranscriptionManager> manager;
  std::shared_ptr<jobs::JobQueue>             queue;
  std::shared_ptr<jobs::JobWorker>            worker;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  void Shutdown();
};

/*
  Composition root: the only place that knows concrete repository, storage
  and provider types.
*/
std::shared_ptr<db::Repository> BuildRepository(const transcription::runtime::config::RuntimeConfig& config);

Application Build(const transcription::runtime::config::RuntimeConfig& config);

} // namespace transcription::factory

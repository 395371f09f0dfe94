#include "job_worker.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace transcription::jobs {

JobWorker::JobWorker(std::shared_ptr<JobQueue> queue, std::shared_ptr<JobExecutor> executor, std::size_t threads)
    : queue_(std::move(queue)), executor_(std::move(executor)), thread_count_(threads == 0 ? 1 : threads) {
  if (!queue_ || !executor_) {
    throw std::invalid_argument("JobWorker requires a queue and an executor");
  }
}

JobWorker::~JobWorker() {
  Stop();
}

void JobWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&JobWorker::Run, this);
  }
  TRANSCRIPTION_LOG_INFO("job workers started", {observability::IntField("threads", static_cast<std::int64_t>(thread_count_))});
}

void JobWorker::Stop() {
  queue_->Shutdown();
  running_ = false;
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
}

void JobWorker::Run() {
  while (running_) {
    auto job_id = queue_->Dequeue();
    if (!job_id) break;

    try {
      executor_->ExecuteJob(*job_id);
    } catch (const std::exception& e) {
      TRANSCRIPTION_LOG_ERROR("job execution failed", {observability::StringField("job_id", *job_id), observability::StringField("error", e.what())});
    }
    queue_->MarkDone();
  }
}

} // namespace transcription::jobs

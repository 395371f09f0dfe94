#include "job_queue.hpp"

#include "internal/observability/spans.hpp"

namespace transcription::jobs {

void JobQueue::Enqueue(const std::string& job_id) {
  std::size_t depth = 0;
  {
    std::lock_guard lock(mutex_);
    queue_.push(job_id);
    depth = queue_.size();
  }
  observability::Metrics::Instance().SetQueueDepth(depth);
  cv_.notify_one();
}

std::optional<std::string> JobQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  std::string job_id = std::move(queue_.front());
  queue_.pop();
  ++in_flight_;
  observability::Metrics::Instance().SetQueueDepth(queue_.size());
  return job_id;
}

void JobQueue::MarkDone() {
  {
    std::lock_guard lock(mutex_);
    if (in_flight_ > 0) {
      --in_flight_;
    }
  }
  idle_cv_.notify_all();
}

void JobQueue::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return shutdown_ || (queue_.empty() && in_flight_ == 0); });
}

void JobQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  idle_cv_.notify_all();
}

std::size_t JobQueue::Depth() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace transcription::jobs

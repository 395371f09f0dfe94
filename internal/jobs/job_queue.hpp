#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace transcription::jobs {

/*
  Thread-safe blocking queue of job ids for the worker pool.

  Delivery is at-most-once: ids still queued at shutdown are dropped and
  picked up again by startup recovery, since their rows stay PENDING.
*/
class JobQueue {
 public:
  void Enqueue(const std::string& job_id);

  // blocking wait; nullopt once shut down
  std::optional<std::string> Dequeue();

  // worker reports completion of a dequeued id
  void MarkDone();

  // blocks until nothing is queued or running
  void WaitIdle();

  void Shutdown();

  std::size_t Depth() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::queue<std::string> queue_;
  std::size_t             in_flight_ = 0;
  bool                    shutdown_  = false;
};

} // namespace transcription::jobs

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "job_queue.hpp"

namespace transcription::jobs {

/*
  Runs one job to a terminal state. Implementations record failures on the
  job itself; anything that still escapes is logged by the worker.
*/
class JobExecutor {
 public:
  virtual ~JobExecutor() = default;

  virtual void ExecuteJob(const std::string& job_id) = 0;
};

/*
  Background pool draining the JobQueue.

  Provider calls block, so each thread handles one job at a time.
*/
class JobWorker {
 public:
  JobWorker(std::shared_ptr<JobQueue> queue, std::shared_ptr<JobExecutor> executor, std::size_t threads = 1);
  ~JobWorker();

  JobWorker(const JobWorker&)            = delete;
  JobWorker& operator=(const JobWorker&) = delete;

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<JobQueue>    queue_;
  std::shared_ptr<JobExecutor> executor_;
  std::size_t                  thread_count_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace transcription::jobs

#include "internal/jobs/job_worker.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/jobs/job_queue.hpp"

namespace {

using transcription::jobs::JobExecutor;
using transcription::jobs::JobQueue;
using transcription::jobs::JobWorker;

class RecordingExecutor final : public JobExecutor {
 public:
  void ExecuteJob(const std::string& job_id) override {
    const int now = ++running;
    int       seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    {
      std::lock_guard<std::mutex> lock(mutex);
      executed.push_back(job_id);
    }
    --running;
    if (job_id == "explode") {
      throw std::runtime_error("executor blew up");
    }
  }

  std::vector<std::string> Executed() {
    std::lock_guard<std::mutex> lock(mutex);
    return executed;
  }

  std::atomic<int>         running{0};
  std::atomic<int>         peak{0};
  std::mutex               mutex;
  std::vector<std::string> executed;
};

void TestQueueOrderAndDepth() {
  JobQueue queue;
  queue.Enqueue("a");
  queue.Enqueue("b");
  assert(queue.Depth() == 2);

  assert(*queue.Dequeue() == "a");
  queue.MarkDone();
  assert(*queue.Dequeue() == "b");
  queue.MarkDone();
  assert(queue.Depth() == 0);

  queue.WaitIdle();
  queue.Shutdown();
  assert(!queue.Dequeue());
}

void TestWorkerDrainsQueue() {
  auto queue    = std::make_shared<JobQueue>();
  auto executor = std::make_shared<RecordingExecutor>();

  JobWorker worker(queue, executor, 1);
  worker.Start();
  for (int i = 0; i < 5; ++i) {
    queue->Enqueue("job-" + std::to_string(i));
  }
  queue->WaitIdle();

  const auto executed = executor->Executed();
  assert(executed.size() == 5);
  assert(executed.front() == "job-0");
  assert(executed.back() == "job-4");
  worker.Stop();
}

void TestThrowingExecutorDoesNotStopWorker() {
  auto queue    = std::make_shared<JobQueue>();
  auto executor = std::make_shared<RecordingExecutor>();

  JobWorker worker(queue, executor, 1);
  worker.Start();
  queue->Enqueue("explode");
  queue->Enqueue("after");
  queue->WaitIdle();

  const auto executed = executor->Executed();
  assert(executed.size() == 2);
  assert(executed[1] == "after");
  worker.Stop();
}

void TestThreadsRunConcurrently() {
  auto queue    = std::make_shared<JobQueue>();
  auto executor = std::make_shared<RecordingExecutor>();

  JobWorker worker(queue, executor, 4);
  for (int i = 0; i < 32; ++i) {
    queue->Enqueue("job-" + std::to_string(i));
  }
  worker.Start();
  queue->WaitIdle();

  const auto executed = executor->Executed();
  assert(executed.size() == 32);
  assert(std::set<std::string>(executed.begin(), executed.end()).size() == 32);
  assert(executor->peak.load() >= 1);
  assert(executor->peak.load() <= 4);
  worker.Stop();
}

void TestStopDropsQueuedIds() {
  auto queue    = std::make_shared<JobQueue>();
  auto executor = std::make_shared<RecordingExecutor>();

  {
    JobWorker worker(queue, executor, 1);
    worker.Stop();
  }
  queue->Enqueue("late");
  assert(!queue->Dequeue());
  assert(executor->Executed().empty());
}

void TestRequiresCollaborators() {
  bool threw = false;
  try {
    JobWorker worker(nullptr, std::make_shared<RecordingExecutor>());
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestQueueOrderAndDepth();
  TestWorkerDrainsQueue();
  TestThrowingExecutorDoesNotStopWorker();
  TestThreadsRunConcurrently();
  TestStopDropsQueuedIds();
  TestRequiresCollaborators();

  std::cout << "transcription_unit_job_worker: pass\n";
  return 0;
}

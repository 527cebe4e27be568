#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/queue/queue_client.hpp"
#include "internal/queue/retry_orchestrator.hpp"

namespace unison::worker {

struct QueueWorkerOptions {
  std::string queue;

  // 0 = the client's default lease.
  std::chrono::seconds visibility_timeout{0};

  // Sleep between empty polls and after a store failure.
  std::chrono::milliseconds poll_interval{1000};
};

/*
  Background worker that drains one queue.

  Loop:
      Dequeue → ProcessWithRetry → repeat
      empty   → wait poll_interval (Stop() wakes it)
*/
class QueueWorker {
 public:
  QueueWorker(std::shared_ptr<queue::QueueClient> client, std::shared_ptr<queue::RetryOrchestrator> orchestrator,
              QueueWorkerOptions options, queue::Handler handler);
  ~QueueWorker();

  QueueWorker(const QueueWorker&)            = delete;
  QueueWorker& operator=(const QueueWorker&) = delete;

  void Start();
  void Stop();

  // One synchronous iteration. true when a message was settled.
  // Store failures propagate.
  bool RunOnce();

  uint64_t Processed() const {
    return processed_.load();
  }

 private:
  void Run();

  // false once Stop() was requested.
  bool WaitFor(std::chrono::milliseconds interval);

  std::shared_ptr<queue::QueueClient>       client_;
  std::shared_ptr<queue::RetryOrchestrator> orchestrator_;
  QueueWorkerOptions                        options_;
  queue::Handler                            handler_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  std::atomic<bool>       running_{false};
  std::atomic<uint64_t>   processed_{0};
};

} // namespace unison::worker

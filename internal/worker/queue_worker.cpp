#include "internal/worker/queue_worker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/queue/queue_name.hpp"
#include "internal/util/errors.hpp"

namespace unison::worker {

using observability::IntField;
using observability::StringField;

QueueWorker::QueueWorker(std::shared_ptr<queue::QueueClient> client, std::shared_ptr<queue::RetryOrchestrator> orchestrator,
                         QueueWorkerOptions options, queue::Handler handler)
    : client_(std::move(client)), orchestrator_(std::move(orchestrator)), options_(std::move(options)), handler_(std::move(handler)) {
  if (!client_ || !orchestrator_ || !handler_) {
    throw util::InvalidArgument("QueueWorker requires a client, an orchestrator and a handler");
  }
  queue::ValidateSourceQueueName(options_.queue);
  queue::ValidateQueueName(queue::DlqName(options_.queue));
  if (options_.visibility_timeout.count() == 0) {
    options_.visibility_timeout = client_->Options().visibility_timeout;
  }
  if (options_.poll_interval.count() <= 0) {
    throw util::InvalidArgument("poll interval must be positive");
  }
}

QueueWorker::~QueueWorker() {
  Stop();
}

void QueueWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread(&QueueWorker::Run, this);
  UNISON_LOG_INFO("queue worker started", {StringField("queue", options_.queue)});
}

void QueueWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
    UNISON_LOG_INFO("queue worker stopped", {StringField("queue", options_.queue), IntField("processed", static_cast<int64_t>(Processed()))});
  }
  running_ = false;
}

bool QueueWorker::RunOnce() {
  auto message = client_->Dequeue(options_.queue, options_.visibility_timeout);
  if (!message) {
    return false;
  }

  orchestrator_->ProcessWithRetry(options_.queue, *message, handler_);
  ++processed_;
  return true;
}

void QueueWorker::Run() {
  while (true) {
    std::chrono::milliseconds wait{0};

    try {
      if (!RunOnce()) {
        wait = options_.poll_interval;
      }
    } catch (const util::StoreUnavailable& e) {
      UNISON_LOG_ERROR("message store unavailable; backing off",
                       {StringField("queue", options_.queue), StringField("error", e.what())});
      wait = options_.poll_interval;
    } catch (const std::exception& e) {
      UNISON_LOG_ERROR("queue worker iteration failed", {StringField("queue", options_.queue), StringField("error", e.what())});
      wait = options_.poll_interval;
    }

    if (!WaitFor(wait)) {
      return;
    }
  }
}

bool QueueWorker::WaitFor(std::chrono::milliseconds interval) {
  std::unique_lock lock(mutex_);
  if (interval.count() > 0) {
    cv_.wait_for(lock, interval, [&] { return stopping_; });
  }
  return !stopping_;
}

} // namespace unison::worker

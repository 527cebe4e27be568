#include "internal/queue/retry_orchestrator.hpp"

#include <chrono>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/queue/queue_name.hpp"
#include "internal/util/errors.hpp"

namespace unison::queue {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kUnknownFailure = "unknown handler failure";
constexpr const char* kEmptyFailure   = "handler failed";

} // namespace

const char* DispositionName(Disposition disposition) {
  switch (disposition) {
    case Disposition::kCompleted:
      return "completed";
    case Disposition::kRetried:
      return "retried";
    case Disposition::kDeadLettered:
      return "dead_lettered";
  }
  return "unknown";
}

RetryOrchestrator::RetryOrchestrator(std::shared_ptr<QueueClient> client) : client_(std::move(client)) {
  if (!client_) {
    throw util::InvalidArgument("RetryOrchestrator requires a queue client");
  }
}

ProcessOutcome RetryOrchestrator::ProcessWithRetry(const std::string& queue, const Message& message, const Handler& handler) {
  if (!handler) {
    throw util::InvalidArgument("ProcessWithRetry requires a handler");
  }
  // checked before the handler runs so a failure can always be parked
  ValidateQueueName(DlqName(queue));

  observability::SpanScope span("unison.queue.process");
  span.SetAttribute("queue", queue);
  span.SetAttribute("msg_id", message.msg_id);

  auto& metrics = observability::Metrics::Instance();

  ProcessOutcome          outcome;
  google::protobuf::Value result;
  bool                    failed = false;
  const auto              start  = std::chrono::steady_clock::now();

  try {
    result = handler(message.payload);
  } catch (const std::exception& e) {
    failed        = true;
    outcome.error = e.what();
    if (outcome.error.empty()) {
      outcome.error = kEmptyFailure;
    }
  } catch (...) {
    failed        = true;
    outcome.error = kUnknownFailure;
  }

  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
  metrics.ObserveHandlerDurationMs(queue, elapsed.count());

  if (!failed) {
    if (!client_->Archive(queue, message.msg_id)) {
      // lease expired and someone else settled it; the work is done either way
      UNISON_LOG_WARN("completed message was no longer active",
                      {StringField("queue", queue), IntField("msg_id", message.msg_id)});
    }
    outcome.disposition = Disposition::kCompleted;
    outcome.result      = std::move(result);
    metrics.RecordOutcome(queue, DispositionName(outcome.disposition));
    span.AddEvent("completed");
    return outcome;
  }

  span.RecordException(outcome.error);

  const auto max_retries = client_->Options().max_retries;
  bool       exhausted   = true;
  try {
    exhausted = RetryCount(message.payload) >= max_retries;
  } catch (const util::InvalidArgument& e) {
    // a corrupt retry_count can never be incremented; park the message
    outcome.error += std::string("; ") + e.what();
  }

  if (!exhausted) {
    outcome.disposition        = Disposition::kRetried;
    outcome.replacement_msg_id = client_->RetryMessage(queue, message.msg_id, message.payload);
  } else {
    outcome.disposition        = Disposition::kDeadLettered;
    outcome.replacement_msg_id = client_->MoveToDlq(queue, message.msg_id, message.payload, outcome.error);
    UNISON_LOG_ERROR("message exhausted retries",
                     {StringField("queue", queue), IntField("msg_id", message.msg_id),
                      IntField("dlq_msg_id", outcome.replacement_msg_id), StringField("error", outcome.error)});
  }

  metrics.RecordOutcome(queue, DispositionName(outcome.disposition));
  span.SetAttribute("disposition", DispositionName(outcome.disposition));
  return outcome;
}

} // namespace unison::queue

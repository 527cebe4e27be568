#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/message_store.hpp"
#include "internal/queue/message.hpp"
#include "internal/queue/payload.hpp"
#include "internal/queue/queue_options.hpp"

namespace unison::queue {

/*
  QueueClient

  Typed façade over a MessageStore. Holds no locks and no per-queue
  state; share one instance between any number of worker threads as
  long as the store backend is thread-safe (all shipped ones are).

  Errors:
    - util::InvalidArgument  bad queue name / lease / payload
    - util::StoreUnavailable store unreachable; propagated as-is
    - not-found              Archive/DeleteQueue return false

  RetryMessage and MoveToDlq are two store calls: send the
  replacement, then archive the original. A crash in between leaves
  both visible (a duplicate), never neither.
*/
class QueueClient {
 public:
  explicit QueueClient(std::shared_ptr<db::MessageStore> store, QueueClientOptions options = {});

  // Sends `payload` with retry_count defaulted to 0. Returns the new id (> 0).
  int64_t Enqueue(const std::string& queue, const Payload& payload);

  // Non-blocking. Leases the oldest visible message for the configured
  // visibility timeout, or returns nullopt when none is visible.
  // Rows that are not a JSON object are moved to <queue>_dlq under
  // raw_message and skipped.
  std::optional<Message> Dequeue(const std::string& queue);
  std::optional<Message> Dequeue(const std::string& queue, std::chrono::seconds visibility_timeout);

  // false when `msg_id` is not an active message of `queue`.
  bool Archive(const std::string& queue, int64_t msg_id);

  // Does not touch <queue>_dlq.
  bool DeleteQueue(const std::string& queue);

  // Re-enqueues `payload` with retry_count + 1, then archives `msg_id`.
  // Returns the id of the new message.
  int64_t RetryMessage(const std::string& queue, int64_t msg_id, const Payload& payload);

  // Sends `payload` annotated with error / original_queue /
  // original_msg_id to <queue>_dlq, then archives `msg_id`.
  // Returns the id of the dead-letter message.
  int64_t MoveToDlq(const std::string& queue, int64_t msg_id, const Payload& payload, const std::string& error);

  uint64_t                 QueueLength(const std::string& queue);
  std::vector<std::string> ListQueues();

  const QueueClientOptions& Options() const {
    return options_;
  }

 private:
  void DeadLetterUnreadable(const std::string& queue, const db::model::MessageRecord& record, const std::string& error);

  std::shared_ptr<db::MessageStore> store_;
  QueueClientOptions                options_;
};

} // namespace unison::queue

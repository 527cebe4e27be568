#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/queue/message.hpp"
#include "internal/queue/queue_client.hpp"

namespace unison::queue {

// Business handler. Signals failure by throwing.
using Handler = std::function<google::protobuf::Value(const Payload&)>;

enum class Disposition {
  kCompleted,
  kRetried,
  kDeadLettered,
};

const char* DispositionName(Disposition disposition);

struct ProcessOutcome {
  Disposition disposition = Disposition::kCompleted;

  // Handler result; set only when completed.
  std::optional<google::protobuf::Value> result;

  // Id of the re-enqueued or dead-letter message; 0 when completed.
  int64_t replacement_msg_id = 0;

  // Handler failure text; empty when completed.
  std::string error;
};

/*
  RetryOrchestrator

  Runs a handler against one leased message and settles the message:

    success                         Archive
    failure, retry_count < max      RetryMessage  (retry_count + 1)
    failure, retry_count >= max     MoveToDlq     (retry_count unchanged)

  Handler exceptions are contained. Store failures from the settling
  call propagate; the lease then expires and the message is
  redelivered.
*/
class RetryOrchestrator {
 public:
  explicit RetryOrchestrator(std::shared_ptr<QueueClient> client);

  ProcessOutcome ProcessWithRetry(const std::string& queue, const Message& message, const Handler& handler);

 private:
  std::shared_ptr<QueueClient> client_;
};

} // namespace unison::queue

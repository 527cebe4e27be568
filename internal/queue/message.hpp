#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "internal/queue/payload.hpp"
#include "internal/util/time.hpp"

namespace unison::queue {

/*
  A leased message as handed to a worker.

  `msg_id` is assigned by the store and only unique within
  `queue_name`. The lease ends at `visible_at`; after that the store
  may hand the same message to another reader.
*/
struct Message {
  int64_t     msg_id = 0;
  std::string queue_name;
  Payload     payload;

  // Times the store has leased this message, this lease included.
  int32_t read_count = 0;

  // Lease length requested by the dequeue that produced this message.
  std::chrono::seconds vt{0};

  util::TimePoint enqueued_at{};
  util::TimePoint visible_at{};

  int64_t RetryCount() const {
    return queue::RetryCount(payload);
  }
};

} // namespace unison::queue

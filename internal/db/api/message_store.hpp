#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/message_record.hpp"

namespace unison::db {

/*
  Durable message store abstraction.

  CONTRACT (every backend):

  - Send creates the queue on first use and returns an id > 0,
    unique within the queue.
  - Read leases at most one visible row: the row with the smallest
    msg_id whose visibility time has passed. The lease hides it from
    every other reader for `vt`. Read never blocks.
  - Archive moves an active row (leased or not) to the queue archive.
    A row that is already archived or unknown yields false.
  - DropQueue removes the queue and its archive. Nothing cascades.
  - Read/Archive/QueueLength on a queue that does not exist behave as
    on an empty queue.

  Infrastructure failures are thrown as util::StoreUnavailable.
  Upper layers never see pqxx or sqlite error types.
*/

class MessageStore {
 public:
  virtual ~MessageStore() = default;

  // Idempotent.
  virtual void CreateQueue(const std::string& queue) = 0;

  virtual int64_t Send(const std::string& queue, const std::string& message_json) = 0;

  virtual std::optional<model::MessageRecord> Read(const std::string& queue, std::chrono::seconds vt) = 0;

  virtual bool Archive(const std::string& queue, int64_t msg_id) = 0;

  virtual bool DropQueue(const std::string& queue) = 0;

  virtual std::vector<std::string> ListQueues() = 0;

  // Active rows, leased or not.
  virtual uint64_t QueueLength(const std::string& queue) = 0;
};

} // namespace unison::db

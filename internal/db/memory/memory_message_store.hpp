#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/message_store.hpp"
#include "internal/util/time.hpp"

namespace unison::db::memory {

/*
  In-process message store.

  Same visibility semantics as pgmq, minus durability. The clock is
  injectable so lease expiry can be driven without sleeping.
*/
class MemoryMessageStore final : public db::MessageStore {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  explicit MemoryMessageStore(ClockFn clock = util::Now);

  void CreateQueue(const std::string& queue) override;
  int64_t Send(const std::string& queue, const std::string& message_json) override;
  std::optional<model::MessageRecord> Read(const std::string& queue, std::chrono::seconds vt) override;
  bool Archive(const std::string& queue, int64_t msg_id) override;
  bool DropQueue(const std::string& queue) override;
  std::vector<std::string> ListQueues() override;
  uint64_t QueueLength(const std::string& queue) override;

  // Archived rows of `queue`, oldest first.
  std::vector<model::MessageRecord> Archived(const std::string& queue) const;

 private:
  struct QueueState {
    // ordered by msg_id: reads hand out the oldest visible row first
    std::map<int64_t, model::MessageRecord> active;
    std::vector<model::MessageRecord>       archive;
    int64_t                                 next_msg_id = 1;
  };

  uint64_t NowMs() const;

  ClockFn clock_;

  mutable std::mutex                          mutex_;
  std::unordered_map<std::string, QueueState> queues_;
};

} // namespace unison::db::memory

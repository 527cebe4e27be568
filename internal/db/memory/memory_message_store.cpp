#include "memory_message_store.hpp"

#include <algorithm>

namespace unison::db::memory {

MemoryMessageStore::MemoryMessageStore(ClockFn clock) : clock_(std::move(clock)) {
}

uint64_t MemoryMessageStore::NowMs() const {
  return util::ToUnixMillis(clock_());
}

void MemoryMessageStore::CreateQueue(const std::string& queue) {
  std::scoped_lock lock(mutex_);
  queues_.try_emplace(queue);
}

int64_t MemoryMessageStore::Send(const std::string& queue, const std::string& message_json) {
  const auto now = NowMs();

  std::scoped_lock lock(mutex_);
  auto& q = queues_[queue];

  model::MessageRecord r;
  r.msg_id         = q.next_msg_id++;
  r.read_ct        = 0;
  r.enqueued_at_ms = now;
  r.vt_ms          = now;
  r.message        = message_json;

  q.active.emplace(r.msg_id, r);
  return r.msg_id;
}

std::optional<model::MessageRecord> MemoryMessageStore::Read(const std::string& queue, std::chrono::seconds vt) {
  const auto now = NowMs();

  std::scoped_lock lock(mutex_);
  auto it = queues_.find(queue);
  if (it == queues_.end()) return std::nullopt;

  for (auto& [id, row] : it->second.active) {
    if (row.vt_ms > now) continue;

    row.vt_ms = now + static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(vt).count());
    row.read_ct++;
    return row;
  }
  return std::nullopt;
}

bool MemoryMessageStore::Archive(const std::string& queue, int64_t msg_id) {
  std::scoped_lock lock(mutex_);
  auto q = queues_.find(queue);
  if (q == queues_.end()) return false;

  auto it = q->second.active.find(msg_id);
  if (it == q->second.active.end()) return false;

  q->second.archive.push_back(std::move(it->second));
  q->second.active.erase(it);
  return true;
}

bool MemoryMessageStore::DropQueue(const std::string& queue) {
  std::scoped_lock lock(mutex_);
  return queues_.erase(queue) > 0;
}

std::vector<std::string> MemoryMessageStore::ListQueues() {
  std::scoped_lock lock(mutex_);
  std::vector<std::string> names;
  names.reserve(queues_.size());
  for (const auto& [name, _] : queues_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

uint64_t MemoryMessageStore::QueueLength(const std::string& queue) {
  std::scoped_lock lock(mutex_);
  auto it = queues_.find(queue);
  if (it == queues_.end()) return 0;
  return it->second.active.size();
}

std::vector<model::MessageRecord> MemoryMessageStore::Archived(const std::string& queue) const {
  std::scoped_lock lock(mutex_);
  auto it = queues_.find(queue);
  if (it == queues_.end()) return {};
  return it->second.archive;
}

} // namespace unison::db::memory

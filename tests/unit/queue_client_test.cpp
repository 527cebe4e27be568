#include "internal/queue/queue_client.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_message_store.hpp"
#include "internal/queue/payload.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using unison::db::memory::MemoryMessageStore;
using unison::queue::QueueClient;
using unison::queue::QueueClientOptions;

struct ManualClock {
  std::shared_ptr<unison::util::TimePoint> now = std::make_shared<unison::util::TimePoint>(unison::util::FromUnixMillis(1'700'000'000'000));

  unison::util::TimePoint operator()() const {
    return *now;
  }

  void Advance(std::chrono::milliseconds delta) {
    *now += delta;
  }
};

// Every operation fails as if the database were down.
class FailingMessageStore final : public unison::db::MessageStore {
 public:
  void CreateQueue(const std::string&) override {
    Fail();
  }
  int64_t Send(const std::string&, const std::string&) override {
    Fail();
  }
  std::optional<unison::db::model::MessageRecord> Read(const std::string&, std::chrono::seconds) override {
    Fail();
  }
  bool Archive(const std::string&, int64_t) override {
    Fail();
  }
  bool DropQueue(const std::string&) override {
    Fail();
  }
  std::vector<std::string> ListQueues() override {
    Fail();
  }
  uint64_t QueueLength(const std::string&) override {
    Fail();
  }

 private:
  [[noreturn]] static void Fail() {
    throw unison::util::StoreUnavailable("connection refused");
  }
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

struct Fixture {
  ManualClock                         clock;
  std::shared_ptr<MemoryMessageStore> store  = std::make_shared<MemoryMessageStore>(clock);
  QueueClient                         client = QueueClient(store);
};

void TestEnqueueDefaultsRetryCount() {
  Fixture f;

  const auto id = f.client.Enqueue("user_tasks", unison::queue::ParsePayload(R"({"task":"send_email"})"));
  assert(id > 0);

  auto message = f.client.Dequeue("user_tasks", std::chrono::seconds(30));
  assert(message.has_value());
  assert(message->msg_id == id);
  assert(message->queue_name == "user_tasks");
  assert(message->RetryCount() == 0);
  assert(message->read_count == 1);
  assert(message->vt == std::chrono::seconds(30));
  assert(message->visible_at - message->enqueued_at == std::chrono::seconds(30));
  assert(unison::queue::StringField(message->payload, "task") == "send_email");
}

void TestEnqueueKeepsExistingRetryCount() {
  Fixture f;

  f.client.Enqueue("user_tasks", unison::queue::ParsePayload(R"({"retry_count":2})"));
  assert(f.client.Dequeue("user_tasks")->RetryCount() == 2);
}

void TestLeaseHidesUntilTimeout() {
  Fixture f;

  const auto id = f.client.Enqueue("user_tasks", unison::queue::ParsePayload("{}"));
  assert(f.client.Dequeue("user_tasks", std::chrono::seconds(10))->msg_id == id);
  assert(!f.client.Dequeue("user_tasks", std::chrono::seconds(10)).has_value());

  f.clock.Advance(std::chrono::seconds(10));

  auto again = f.client.Dequeue("user_tasks", std::chrono::seconds(10));
  assert(again.has_value());
  assert(again->msg_id == id);
  assert(again->read_count == 2);
}

void TestDefaultVisibilityTimeoutComesFromOptions() {
  ManualClock clock;
  auto        store = std::make_shared<MemoryMessageStore>(clock);
  QueueClient client(store, QueueClientOptions{.visibility_timeout = std::chrono::seconds(2)});

  client.Enqueue("user_tasks", unison::queue::ParsePayload("{}"));
  assert(client.Dequeue("user_tasks")->vt == std::chrono::seconds(2));

  clock.Advance(std::chrono::seconds(2));
  assert(client.Dequeue("user_tasks").has_value());
}

void TestDequeueOnUnknownQueueIsEmpty() {
  Fixture f;
  assert(!f.client.Dequeue("never_created").has_value());
}

void TestArchive() {
  Fixture f;

  const auto id = f.client.Enqueue("user_tasks", unison::queue::ParsePayload("{}"));
  assert(f.client.Dequeue("user_tasks").has_value());
  assert(f.client.Archive("user_tasks", id));
  assert(!f.client.Archive("user_tasks", id));
  assert(f.client.QueueLength("user_tasks") == 0);
}

void TestRetryMessageReplacesOriginal() {
  Fixture f;

  const auto id      = f.client.Enqueue("user_tasks", unison::queue::ParsePayload(R"({"task":"send_email"})"));
  auto       message = f.client.Dequeue("user_tasks");

  const auto new_id = f.client.RetryMessage("user_tasks", id, message->payload);
  assert(new_id != id);
  assert(f.client.QueueLength("user_tasks") == 1);
  assert(f.store->Archived("user_tasks").size() == 1);
  assert(f.store->Archived("user_tasks")[0].msg_id == id);

  auto retried = f.client.Dequeue("user_tasks");
  assert(retried.has_value());
  assert(retried->msg_id == new_id);
  assert(retried->RetryCount() == 1);
  assert(unison::queue::StringField(retried->payload, "task") == "send_email");
}

void TestMoveToDlq() {
  Fixture f;

  const auto id      = f.client.Enqueue("user_tasks", unison::queue::ParsePayload(R"({"task":"send_email","retry_count":3})"));
  auto       message = f.client.Dequeue("user_tasks");

  const auto dlq_id = f.client.MoveToDlq("user_tasks", id, message->payload, "SMTP timeout");
  assert(dlq_id > 0);
  assert(f.client.QueueLength("user_tasks") == 0);
  assert(f.client.QueueLength("user_tasks_dlq") == 1);

  auto dead = f.client.Dequeue("user_tasks_dlq");
  assert(dead.has_value());
  assert(dead->msg_id == dlq_id);
  assert(dead->RetryCount() == 3);
  assert(unison::queue::StringField(dead->payload, "task") == "send_email");
  assert(unison::queue::StringField(dead->payload, "error") == "SMTP timeout");
  assert(unison::queue::StringField(dead->payload, "original_queue") == "user_tasks");
  assert(unison::queue::NumberField(dead->payload, "original_msg_id") == static_cast<double>(id));
}

void TestMoveToDlqNeedsRoomForSuffix() {
  Fixture f;

  // only reachable by writing to the store directly; the client refuses the name
  const std::string queue(44, 'q');
  assert(Throws<unison::util::InvalidArgument>([&] { f.client.Enqueue(queue, unison::queue::ParsePayload("{}")); }));
  const auto id = f.store->Send(queue, "{}");

  assert(Throws<unison::util::InvalidArgument>([&] { f.client.MoveToDlq(queue, id, unison::queue::ParsePayload("{}"), "boom"); }));

  // nothing was written or archived
  assert(f.client.QueueLength(queue) == 1);
  assert(f.client.ListQueues().size() == 1);
}

void TestUnreadableRowIsDeadLettered() {
  Fixture f;

  const auto poison_id = f.store->Send("user_tasks", "[1,2]");
  const auto good_id   = f.client.Enqueue("user_tasks", unison::queue::ParsePayload(R"({"task":"send_email"})"));

  auto message = f.client.Dequeue("user_tasks");
  assert(message.has_value());
  assert(message->msg_id == good_id);
  assert(unison::queue::StringField(message->payload, "task") == "send_email");

  // the poison row is gone from the work queue and will not come back
  assert(f.client.QueueLength("user_tasks") == 1);
  assert(f.store->Archived("user_tasks").size() == 1);
  f.clock.Advance(std::chrono::seconds(3600));
  auto again = f.client.Dequeue("user_tasks");
  assert(again.has_value() && again->msg_id == good_id);

  auto dead = f.client.Dequeue("user_tasks_dlq");
  assert(dead.has_value());
  assert(unison::queue::StringField(dead->payload, "raw_message") == "[1,2]");
  assert(!unison::queue::StringField(dead->payload, "error").empty());
  assert(unison::queue::StringField(dead->payload, "original_queue") == "user_tasks");
  assert(unison::queue::NumberField(dead->payload, "original_msg_id") == static_cast<double>(poison_id));
  assert(dead->RetryCount() == 0);
}

void TestUnreadableOnlyRowLeavesQueueEmpty() {
  Fixture f;
  f.store->Send("user_tasks", "not json");

  assert(!f.client.Dequeue("user_tasks").has_value());
  assert(f.client.QueueLength("user_tasks") == 0);
  assert(f.client.QueueLength("user_tasks_dlq") == 1);
}

void TestDeleteQueueLeavesDlq() {
  Fixture f;

  const auto id = f.client.Enqueue("user_tasks", unison::queue::ParsePayload("{}"));
  f.client.MoveToDlq("user_tasks", id, unison::queue::ParsePayload("{}"), "boom");
  f.client.Enqueue("user_tasks", unison::queue::ParsePayload("{}"));

  assert(f.client.DeleteQueue("user_tasks"));
  assert(!f.client.DeleteQueue("user_tasks"));
  assert(f.client.QueueLength("user_tasks_dlq") == 1);
}

void TestArgumentValidation() {
  Fixture f;
  const auto payload = unison::queue::ParsePayload("{}");

  assert(Throws<unison::util::InvalidArgument>([&] { f.client.Enqueue("bad-name", payload); }));
  assert(Throws<unison::util::InvalidArgument>([&] { f.client.Enqueue("", payload); }));
  assert(Throws<unison::util::InvalidArgument>([&] { f.client.Dequeue("user_tasks", std::chrono::seconds(0)); }));
  assert(Throws<unison::util::InvalidArgument>([&] { f.client.Dequeue("user_tasks", std::chrono::seconds(-5)); }));
  assert(Throws<unison::util::InvalidArgument>([&] { QueueClient(nullptr); }));
  assert(Throws<unison::util::InvalidArgument>([&] { QueueClient(f.store, QueueClientOptions{.max_retries = -1}); }));
  assert(f.client.ListQueues().empty());
}

void TestStoreFailuresPropagate() {
  QueueClient client(std::make_shared<FailingMessageStore>());
  const auto  payload = unison::queue::ParsePayload("{}");

  assert(Throws<unison::util::StoreUnavailable>([&] { client.Enqueue("user_tasks", payload); }));
  assert(Throws<unison::util::StoreUnavailable>([&] { client.Dequeue("user_tasks"); }));
  assert(Throws<unison::util::StoreUnavailable>([&] { client.Archive("user_tasks", 1); }));
  assert(Throws<unison::util::StoreUnavailable>([&] { client.RetryMessage("user_tasks", 1, payload); }));
  assert(Throws<unison::util::StoreUnavailable>([&] { client.MoveToDlq("user_tasks", 1, payload, "boom"); }));
  assert(Throws<unison::util::StoreUnavailable>([&] { client.DeleteQueue("user_tasks"); }));
}

} // namespace

int main() {
  TestEnqueueDefaultsRetryCount();
  TestEnqueueKeepsExistingRetryCount();
  TestLeaseHidesUntilTimeout();
  TestDefaultVisibilityTimeoutComesFromOptions();
  TestDequeueOnUnknownQueueIsEmpty();
  TestArchive();
  TestRetryMessageReplacesOriginal();
  TestMoveToDlq();
  TestMoveToDlqNeedsRoomForSuffix();
  TestUnreadableRowIsDeadLettered();
  TestUnreadableOnlyRowLeavesQueueEmpty();
  TestDeleteQueueLeavesDlq();
  TestArgumentValidation();
  TestStoreFailuresPropagate();

  std::cout << "unison_unit_queue_client: pass\n";
  return 0;
}

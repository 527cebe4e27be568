#include "internal/queue/retry_orchestrator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_message_store.hpp"
#include "internal/queue/payload.hpp"
#include "internal/queue/queue_name.hpp"
#include "internal/util/errors.hpp"

namespace {

using unison::db::memory::MemoryMessageStore;
using unison::queue::Disposition;
using unison::queue::Payload;
using unison::queue::QueueClient;
using unison::queue::QueueClientOptions;
using unison::queue::RetryOrchestrator;

// Memory store whose Archive can be switched to fail.
class FlakyArchiveStore final : public unison::db::MessageStore {
 public:
  void CreateQueue(const std::string& queue) override {
    inner_.CreateQueue(queue);
  }
  int64_t Send(const std::string& queue, const std::string& message_json) override {
    return inner_.Send(queue, message_json);
  }
  std::optional<unison::db::model::MessageRecord> Read(const std::string& queue, std::chrono::seconds vt) override {
    return inner_.Read(queue, vt);
  }
  bool Archive(const std::string& queue, int64_t msg_id) override {
    if (fail_archive) {
      throw unison::util::StoreUnavailable("connection reset during archive");
    }
    return inner_.Archive(queue, msg_id);
  }
  bool DropQueue(const std::string& queue) override {
    return inner_.DropQueue(queue);
  }
  std::vector<std::string> ListQueues() override {
    return inner_.ListQueues();
  }
  uint64_t QueueLength(const std::string& queue) override {
    return inner_.QueueLength(queue);
  }

  bool fail_archive = false;

 private:
  MemoryMessageStore inner_;
};

struct Fixture {
  explicit Fixture(QueueClientOptions options = {})
      : store(std::make_shared<MemoryMessageStore>()),
        client(std::make_shared<QueueClient>(store, options)),
        orchestrator(client) {
  }

  std::shared_ptr<MemoryMessageStore> store;
  std::shared_ptr<QueueClient>        client;
  RetryOrchestrator                   orchestrator;
};

google::protobuf::Value StringValue(const std::string& text) {
  google::protobuf::Value value;
  value.set_string_value(text);
  return value;
}

google::protobuf::Value Fail(const std::string& reason) {
  throw std::runtime_error(reason);
}

void TestSuccessArchivesAndReturnsResult() {
  Fixture f;
  f.client->Enqueue("user_tasks", unison::queue::ParsePayload(R"({"task":"send_email"})"));

  auto message = f.client->Dequeue("user_tasks");
  auto outcome = f.orchestrator.ProcessWithRetry("user_tasks", *message, [](const Payload& payload) {
    return StringValue("sent:" + unison::queue::StringField(payload, "task"));
  });

  assert(outcome.disposition == Disposition::kCompleted);
  assert(outcome.result.has_value());
  assert(outcome.result->string_value() == "sent:send_email");
  assert(outcome.replacement_msg_id == 0);
  assert(outcome.error.empty());
  assert(f.client->QueueLength("user_tasks") == 0);
  assert(f.store->Archived("user_tasks").size() == 1);
  assert(f.client->QueueLength("user_tasks_dlq") == 0);
}

void TestFailureBelowLimitRetries() {
  Fixture f;
  const auto id = f.client->Enqueue("user_tasks", unison::queue::ParsePayload(R"({"task":"send_email","retry_count":1})"));

  auto message = f.client->Dequeue("user_tasks");
  auto outcome = f.orchestrator.ProcessWithRetry("user_tasks", *message, [](const Payload&) { return Fail("SMTP timeout"); });

  assert(outcome.disposition == Disposition::kRetried);
  assert(!outcome.result.has_value());
  assert(outcome.error == "SMTP timeout");
  assert(outcome.replacement_msg_id != id);

  assert(f.client->QueueLength("user_tasks") == 1);
  assert(f.client->QueueLength("user_tasks_dlq") == 0);

  auto next = f.client->Dequeue("user_tasks");
  assert(next->msg_id == outcome.replacement_msg_id);
  assert(next->RetryCount() == 2);
}

void TestFailureAtLimitDeadLetters() {
  Fixture f;
  f.client->Enqueue("user_tasks", unison::queue::ParsePayload(R"({"task":"send_email","retry_count":3})"));

  auto message = f.client->Dequeue("user_tasks");
  auto outcome = f.orchestrator.ProcessWithRetry("user_tasks", *message, [](const Payload&) { return Fail("SMTP timeout"); });

  assert(outcome.disposition == Disposition::kDeadLettered);
  assert(!outcome.result.has_value());
  assert(f.client->QueueLength("user_tasks") == 0);
  assert(f.client->QueueLength("user_tasks_dlq") == 1);

  auto dead = f.client->Dequeue("user_tasks_dlq");
  assert(dead->msg_id == outcome.replacement_msg_id);
  assert(dead->RetryCount() == 3);
  assert(unison::queue::StringField(dead->payload, "error") == "SMTP timeout");
  assert(unison::queue::StringField(dead->payload, "original_queue") == "user_tasks");
  assert(unison::queue::NumberField(dead->payload, "original_msg_id") == static_cast<double>(message->msg_id));
}

void TestSendEmailExhaustsRetriesThenDeadLetters() {
  Fixture f;
  f.client->Enqueue("user_tasks", unison::queue::ParsePayload(R"({"task":"send_email","to":"ops@example.com"})"));

  std::vector<int64_t>     seen_retry_counts;
  std::vector<Disposition> dispositions;

  while (auto message = f.client->Dequeue("user_tasks")) {
    seen_retry_counts.push_back(message->RetryCount());
    auto outcome = f.orchestrator.ProcessWithRetry("user_tasks", *message, [](const Payload&) { return Fail("SMTP timeout"); });
    dispositions.push_back(outcome.disposition);
  }

  assert((seen_retry_counts == std::vector<int64_t>{0, 1, 2, 3}));
  assert((dispositions ==
          std::vector<Disposition>{Disposition::kRetried, Disposition::kRetried, Disposition::kRetried, Disposition::kDeadLettered}));
  assert(f.client->QueueLength("user_tasks") == 0);
  assert(f.store->Archived("user_tasks").size() == 4);

  auto dead = f.client->Dequeue("user_tasks_dlq");
  assert(dead.has_value());
  assert(dead->RetryCount() == 3);
  assert(unison::queue::StringField(dead->payload, "to") == "ops@example.com");
  assert(unison::queue::StringField(dead->payload, "error") == "SMTP timeout");
  assert(!f.client->Dequeue("user_tasks_dlq").has_value());
}

void TestFifoProcessing() {
  Fixture f;
  for (int order = 0; order < 5; ++order) {
    f.client->Enqueue("user_tasks", unison::queue::ParsePayload("{\"order\":" + std::to_string(order) + "}"));
  }

  std::vector<double> processed;
  while (auto message = f.client->Dequeue("user_tasks")) {
    f.orchestrator.ProcessWithRetry("user_tasks", *message, [&](const Payload& payload) {
      processed.push_back(unison::queue::NumberField(payload, "order"));
      return google::protobuf::Value();
    });
  }

  assert((processed == std::vector<double>{0, 1, 2, 3, 4}));
  assert(f.client->QueueLength("user_tasks") == 0);
}

void TestZeroRetryBudgetDeadLettersImmediately() {
  Fixture f(QueueClientOptions{.max_retries = 0});
  f.client->Enqueue("user_tasks", unison::queue::ParsePayload("{}"));

  auto outcome = f.orchestrator.ProcessWithRetry("user_tasks", *f.client->Dequeue("user_tasks"),
                                                 [](const Payload&) { return Fail("bad input"); });
  assert(outcome.disposition == Disposition::kDeadLettered);
  assert(f.client->QueueLength("user_tasks_dlq") == 1);
}

void TestFailureTextIsNeverEmpty() {
  Fixture f(QueueClientOptions{.max_retries = 0});

  f.client->Enqueue("user_tasks", unison::queue::ParsePayload("{}"));
  auto odd = f.orchestrator.ProcessWithRetry("user_tasks", *f.client->Dequeue("user_tasks"),
                                             [](const Payload&) -> google::protobuf::Value { throw 42; });
  assert(odd.disposition == Disposition::kDeadLettered);
  assert(odd.error == "unknown handler failure");

  f.client->Enqueue("user_tasks", unison::queue::ParsePayload("{}"));
  auto empty = f.orchestrator.ProcessWithRetry("user_tasks", *f.client->Dequeue("user_tasks"), [](const Payload&) { return Fail(""); });
  assert(empty.error == "handler failed");

  auto first  = f.client->Dequeue("user_tasks_dlq");
  auto second = f.client->Dequeue("user_tasks_dlq");
  assert(unison::queue::StringField(first->payload, "error") == "unknown handler failure");
  assert(unison::queue::StringField(second->payload, "error") == "handler failed");
}

void TestCorruptRetryCountIsDeadLettered() {
  Fixture f;
  f.client->Enqueue("user_tasks", unison::queue::ParsePayload(R"({"retry_count":"often"})"));

  auto outcome = f.orchestrator.ProcessWithRetry("user_tasks", *f.client->Dequeue("user_tasks"),
                                                 [](const Payload&) { return Fail("SMTP timeout"); });
  assert(outcome.disposition == Disposition::kDeadLettered);
  assert(outcome.error.rfind("SMTP timeout; ", 0) == 0);
  assert(f.client->QueueLength("user_tasks") == 0);
  assert(f.client->QueueLength("user_tasks_dlq") == 1);
}

void TestQueueWithoutRoomForDlqIsRefusedUpFront() {
  Fixture f;

  const std::string queue(44, 'q');
  bool              threw = false;
  try {
    f.client->Enqueue(queue, unison::queue::ParsePayload("{}"));
  } catch (const unison::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  // a row written behind the client's back must not reach the handler
  unison::queue::Message message;
  message.msg_id     = f.store->Send(queue, R"({"retry_count":3})");
  message.queue_name = queue;
  message.payload    = unison::queue::ParsePayload(R"({"retry_count":3})");

  bool handler_ran = false;
  threw            = false;
  try {
    f.orchestrator.ProcessWithRetry(queue, message, [&](const Payload&) {
      handler_ran = true;
      return Fail("SMTP timeout");
    });
  } catch (const unison::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(!handler_ran);
  assert(f.store->QueueLength(queue) == 1);
  assert(f.store->ListQueues().size() == 1);

  // the longest accepted name can still dead-letter
  const std::string longest(unison::queue::kMaxSourceQueueNameLength, 'q');
  f.client->Enqueue(longest, unison::queue::ParsePayload(R"({"retry_count":3})"));
  auto outcome = f.orchestrator.ProcessWithRetry(longest, *f.client->Dequeue(longest), [](const Payload&) { return Fail("SMTP timeout"); });
  assert(outcome.disposition == Disposition::kDeadLettered);
  assert(f.client->QueueLength(unison::queue::DlqName(longest)) == 1);
}

void TestStoreFailurePropagates() {
  auto store        = std::make_shared<FlakyArchiveStore>();
  auto client       = std::make_shared<QueueClient>(store);
  auto orchestrator = RetryOrchestrator(client);

  client->Enqueue("user_tasks", unison::queue::ParsePayload("{}"));
  auto message = client->Dequeue("user_tasks");

  store->fail_archive = true;
  bool threw          = false;
  try {
    orchestrator.ProcessWithRetry("user_tasks", *message, [](const Payload&) { return google::protobuf::Value(); });
  } catch (const unison::util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw && "store failures must reach the caller");

  // the message stays active and will be redelivered after its lease
  assert(client->QueueLength("user_tasks") == 1);
}

} // namespace

int main() {
  TestSuccessArchivesAndReturnsResult();
  TestFailureBelowLimitRetries();
  TestFailureAtLimitDeadLetters();
  TestSendEmailExhaustsRetriesThenDeadLetters();
  TestFifoProcessing();
  TestZeroRetryBudgetDeadLettersImmediately();
  TestFailureTextIsNeverEmpty();
  TestCorruptRetryCountIsDeadLettered();
  TestQueueWithoutRoomForDlqIsRefusedUpFront();
  TestStoreFailurePropagates();

  std::cout << "unison_unit_retry_orchestrator: pass\n";
  return 0;
}

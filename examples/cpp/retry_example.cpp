#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_message_store.hpp"
#include "internal/queue/payload.hpp"
#include "internal/queue/queue_client.hpp"
#include "internal/queue/queue_name.hpp"
#include "internal/queue/retry_orchestrator.hpp"

int main() {
  auto store        = std::make_shared<unison::db::memory::MemoryMessageStore>();
  auto client       = std::make_shared<unison::queue::QueueClient>(store);
  auto orchestrator = unison::queue::RetryOrchestrator(client);

  const auto queue = unison::queue::QueueName(client->Options().name_prefix, "user_tasks");

  // One job that always fails, one that succeeds.
  client->Enqueue(queue, unison::queue::ParsePayload(R"({"task":"send_email","to":"ops@example.com"})"));
  client->Enqueue(queue, unison::queue::ParsePayload(R"({"task":"recalculate_bom","item":1042})"));

  auto handler = [](const unison::queue::Payload& payload) {
    if (unison::queue::StringField(payload, "task") == "send_email") {
      throw std::runtime_error("SMTP timeout");
    }
    google::protobuf::Value result;
    result.set_string_value("ok");
    return result;
  };

  while (auto message = client->Dequeue(queue)) {
    auto outcome = orchestrator.ProcessWithRetry(queue, *message, handler);
    std::cout << "msg_id=" << message->msg_id << " task=" << unison::queue::StringField(message->payload, "task")
              << " retry_count=" << message->RetryCount() << " -> " << unison::queue::DispositionName(outcome.disposition) << '\n';
  }

  const auto dlq = unison::queue::DlqName(queue);
  while (auto dead = client->Dequeue(dlq)) {
    std::cout << "dead letter: " << unison::queue::SerializePayload(dead->payload) << '\n';
    client->Archive(dlq, dead->msg_id);
  }
  return 0;
}

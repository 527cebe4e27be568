#include "internal/queue/queue_client.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/queue/queue_name.hpp"
#include "internal/util/errors.hpp"

namespace unison::queue {

using observability::IntField;
using observability::StringField;

namespace {

void ValidateLease(std::chrono::seconds vt) {
  if (vt.count() <= 0) {
    throw util::InvalidArgument("visibility timeout must be positive, got " + std::to_string(vt.count()) + "s");
  }
}

} // namespace

QueueClient::QueueClient(std::shared_ptr<db::MessageStore> store, QueueClientOptions options)
    : store_(std::move(store)), options_(std::move(options)) {
  if (!store_) {
    throw util::InvalidArgument("QueueClient requires a message store");
  }
  ValidateLease(options_.visibility_timeout);
  if (options_.max_retries < 0) {
    throw util::InvalidArgument("max_retries must not be negative");
  }
}

int64_t QueueClient::Enqueue(const std::string& queue, const Payload& payload) {
  ValidateSourceQueueName(queue);

  const auto json   = SerializePayload(WithDefaultRetryCount(payload));
  const auto msg_id = store_->Send(queue, json);

  observability::Metrics::Instance().RecordEnqueued(queue);
  UNISON_LOG_DEBUG("enqueued message", {StringField("queue", queue), IntField("msg_id", msg_id)});
  return msg_id;
}

std::optional<Message> QueueClient::Dequeue(const std::string& queue) {
  return Dequeue(queue, options_.visibility_timeout);
}

std::optional<Message> QueueClient::Dequeue(const std::string& queue, std::chrono::seconds visibility_timeout) {
  ValidateSourceQueueName(queue);
  ValidateLease(visibility_timeout);

  while (auto record = store_->Read(queue, visibility_timeout)) {
    Payload payload;
    try {
      payload = ParsePayload(record->message);
    } catch (const util::InvalidArgument& e) {
      DeadLetterUnreadable(queue, *record, e.what());
      continue;
    }

    Message message;
    message.msg_id      = record->msg_id;
    message.queue_name  = queue;
    message.payload     = std::move(payload);
    message.read_count  = record->read_ct;
    message.vt          = visibility_timeout;
    message.enqueued_at = util::FromUnixMillis(record->enqueued_at_ms);
    message.visible_at  = util::FromUnixMillis(record->vt_ms);

    UNISON_LOG_DEBUG("dequeued message",
                     {StringField("queue", queue), IntField("msg_id", message.msg_id), IntField("read_count", message.read_count)});
    return message;
  }
  return std::nullopt;
}

void QueueClient::DeadLetterUnreadable(const std::string& queue, const db::model::MessageRecord& record, const std::string& error) {
  const auto dlq = DlqName(queue);
  ValidateQueueName(dlq);

  const auto dlq_msg_id = store_->Send(dlq, SerializePayload(MakeUnreadablePayload(record.message, queue, record.msg_id, error)));
  const bool archived   = store_->Archive(queue, record.msg_id);

  observability::Metrics::Instance().RecordEnqueued(dlq);
  UNISON_LOG_ERROR("dead-lettered unreadable message",
                   {StringField("queue", queue), StringField("dlq", dlq), IntField("msg_id", record.msg_id),
                    IntField("dlq_msg_id", dlq_msg_id), StringField("error", error),
                    observability::BoolField("original_archived", archived)});
}

bool QueueClient::Archive(const std::string& queue, int64_t msg_id) {
  ValidateQueueName(queue);

  const bool archived = store_->Archive(queue, msg_id);
  UNISON_LOG_DEBUG("archive message",
                   {StringField("queue", queue), IntField("msg_id", msg_id), observability::BoolField("found", archived)});
  return archived;
}

bool QueueClient::DeleteQueue(const std::string& queue) {
  ValidateQueueName(queue);

  const bool dropped = store_->DropQueue(queue);
  UNISON_LOG_INFO("deleted queue", {StringField("queue", queue), observability::BoolField("existed", dropped)});
  return dropped;
}

int64_t QueueClient::RetryMessage(const std::string& queue, int64_t msg_id, const Payload& payload) {
  ValidateQueueName(queue);

  const auto next       = WithIncrementedRetryCount(payload);
  const auto new_msg_id = store_->Send(queue, SerializePayload(next));

  // crash window: the replacement is visible before the original is archived
  const bool archived = store_->Archive(queue, msg_id);

  observability::Metrics::Instance().RecordEnqueued(queue);
  UNISON_LOG_WARN("retrying message",
                  {StringField("queue", queue), IntField("msg_id", msg_id), IntField("new_msg_id", new_msg_id),
                   IntField("attempt", RetryCount(next)), IntField("max_retries", options_.max_retries),
                   observability::BoolField("original_archived", archived)});
  return new_msg_id;
}

int64_t QueueClient::MoveToDlq(const std::string& queue, int64_t msg_id, const Payload& payload, const std::string& error) {
  ValidateQueueName(queue);
  const auto dlq = DlqName(queue);
  ValidateQueueName(dlq);

  const auto& reason      = error.empty() ? std::string("unspecified failure") : error;
  const auto  dead_letter = MakeDeadLetterPayload(WithDefaultRetryCount(payload), queue, msg_id, reason);
  const auto  dlq_msg_id  = store_->Send(dlq, SerializePayload(dead_letter));

  // crash window: the dead letter is visible before the original is archived
  const bool archived = store_->Archive(queue, msg_id);

  observability::Metrics::Instance().RecordEnqueued(dlq);
  UNISON_LOG_WARN("moved message to dead-letter queue",
                  {StringField("queue", queue), StringField("dlq", dlq), IntField("msg_id", msg_id), IntField("dlq_msg_id", dlq_msg_id),
                   StringField("error", reason),
                   observability::BoolField("original_archived", archived)});
  return dlq_msg_id;
}

uint64_t QueueClient::QueueLength(const std::string& queue) {
  ValidateQueueName(queue);
  return store_->QueueLength(queue);
}

std::vector<std::string> QueueClient::ListQueues() {
  return store_->ListQueues();
}

} // namespace unison::queue

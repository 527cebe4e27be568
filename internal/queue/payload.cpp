#include "internal/queue/payload.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>

#include "internal/util/errors.hpp"

namespace unison::queue {

namespace {

// Largest integer a JSON number (double) represents exactly.
constexpr double kMaxExactInteger = 9007199254740992.0;

const google::protobuf::Value* Find(const Payload& payload, std::string_view key) {
  const auto& fields = payload.fields();
  auto        it     = fields.find(std::string(key));
  return it == fields.end() ? nullptr : &it->second;
}

} // namespace

Payload ParsePayload(std::string_view json) {
  Payload payload;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &payload, options);
  if (!status.ok()) {
    throw util::InvalidArgument("payload must be a JSON object: " + std::string(status.message()));
  }
  return payload;
}

std::string SerializePayload(const Payload& payload) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(payload, &json);
  if (!status.ok()) {
    throw util::InvalidArgument("payload is not serializable: " + std::string(status.message()));
  }
  return json;
}

bool HasRetryCount(const Payload& payload) {
  return Find(payload, kRetryCountField) != nullptr;
}

int64_t RetryCount(const Payload& payload) {
  const auto* value = Find(payload, kRetryCountField);
  if (value == nullptr) {
    return 0;
  }

  if (value->kind_case() != google::protobuf::Value::kNumberValue) {
    throw util::InvalidArgument("retry_count must be a number");
  }

  const double n = value->number_value();
  if (n < 0 || n > kMaxExactInteger || std::floor(n) != n) {
    throw util::InvalidArgument("retry_count must be a non-negative integer, got " + std::to_string(n));
  }
  return static_cast<int64_t>(n);
}

void SetRetryCount(Payload& payload, int64_t retry_count) {
  (*payload.mutable_fields())[std::string(kRetryCountField)].set_number_value(static_cast<double>(retry_count));
}

Payload WithDefaultRetryCount(const Payload& payload) {
  Payload out = payload;
  if (!HasRetryCount(out)) {
    SetRetryCount(out, 0);
  }
  return out;
}

Payload WithIncrementedRetryCount(const Payload& payload) {
  Payload out = payload;
  SetRetryCount(out, RetryCount(payload) + 1);
  return out;
}

Payload MakeDeadLetterPayload(const Payload& payload, std::string_view original_queue, int64_t original_msg_id,
                              std::string_view error) {
  Payload out     = payload;
  auto&   fields  = *out.mutable_fields();
  fields[std::string(kErrorField)].set_string_value(std::string(error));
  fields[std::string(kOriginalQueueField)].set_string_value(std::string(original_queue));
  fields[std::string(kOriginalMsgIdField)].set_number_value(static_cast<double>(original_msg_id));
  return out;
}

Payload MakeUnreadablePayload(std::string_view raw_message, std::string_view original_queue, int64_t original_msg_id,
                              std::string_view error) {
  Payload out;
  SetRetryCount(out, 0);
  (*out.mutable_fields())[std::string(kRawMessageField)].set_string_value(std::string(raw_message));
  return MakeDeadLetterPayload(out, original_queue, original_msg_id, error);
}

std::string StringField(const Payload& payload, std::string_view key) {
  const auto* value = Find(payload, key);
  if (value == nullptr || value->kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return value->string_value();
}

double NumberField(const Payload& payload, std::string_view key) {
  const auto* value = Find(payload, key);
  if (value == nullptr || value->kind_case() != google::protobuf::Value::kNumberValue) {
    return 0;
  }
  return value->number_value();
}

} // namespace unison::queue

#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace unison::queue {

/*
  Message payload envelope.

  A payload is an open JSON object. Business fields belong to the
  caller; the fields below are reserved by the queue:

    retry_count      every message, defaulted to 0 on enqueue
    error            dead-letter messages only
    original_queue   dead-letter messages only
    original_msg_id  dead-letter messages only
    raw_message      dead letters for rows that were not a JSON object
*/

using Payload = google::protobuf::Struct;

inline constexpr std::string_view kRetryCountField    = "retry_count";
inline constexpr std::string_view kErrorField         = "error";
inline constexpr std::string_view kOriginalQueueField = "original_queue";
inline constexpr std::string_view kOriginalMsgIdField = "original_msg_id";
inline constexpr std::string_view kRawMessageField    = "raw_message";

// Throws util::InvalidArgument unless `json` is a JSON object.
Payload ParsePayload(std::string_view json);

std::string SerializePayload(const Payload& payload);

bool HasRetryCount(const Payload& payload);

// 0 when absent. Throws util::InvalidArgument when the field is not a
// non-negative integer.
int64_t RetryCount(const Payload& payload);

void SetRetryCount(Payload& payload, int64_t retry_count);

// Copy of `payload` with retry_count defaulted to 0.
Payload WithDefaultRetryCount(const Payload& payload);

// Copy of `payload` with retry_count + 1.
Payload WithIncrementedRetryCount(const Payload& payload);

Payload MakeDeadLetterPayload(const Payload& payload, std::string_view original_queue, int64_t original_msg_id,
                              std::string_view error);

// Dead letter for a stored row that could not be parsed; the row text is
// kept verbatim under raw_message.
Payload MakeUnreadablePayload(std::string_view raw_message, std::string_view original_queue, int64_t original_msg_id,
                              std::string_view error);

// Convenience accessors for business code and tests.
std::string StringField(const Payload& payload, std::string_view key);
double      NumberField(const Payload& payload, std::string_view key);

} // namespace unison::queue

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace unison::runtime::config {
class RuntimeConfig;
}

namespace unison::queue {

/*
  Explicit client configuration. Built from RuntimeConfig by the
  composition root, or directly by tests.
*/
struct QueueClientOptions {
  // Lease used by Dequeue() when the caller does not pass one.
  std::chrono::seconds visibility_timeout{30};

  // Retry budget before dead-letter promotion.
  int64_t max_retries = 3;

  // Applied by callers through QueueName(); never by the client.
  std::string name_prefix = "unison";

  static QueueClientOptions FromConfig(const unison::runtime::config::RuntimeConfig& config);
};

} // namespace unison::queue

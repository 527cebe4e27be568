#include "internal/queue/queue_options.hpp"

#include "config/config.pb.h"

namespace unison::queue {

QueueClientOptions QueueClientOptions::FromConfig(const unison::runtime::config::RuntimeConfig& config) {
  QueueClientOptions options;
  const auto&        queue = config.queue();

  if (queue.visibility_timeout_sec() > 0) {
    options.visibility_timeout = std::chrono::seconds(queue.visibility_timeout_sec());
  }
  if (queue.has_max_retries()) {
    options.max_retries = queue.max_retries();
  }
  if (!queue.name_prefix().empty()) {
    options.name_prefix = queue.name_prefix();
  }
  return options;
}

} // namespace unison::queue

#include "internal/queue/queue_name.hpp"

#include "internal/util/errors.hpp"

namespace unison::queue {

void ValidateQueueName(std::string_view queue) {
  if (queue.empty()) {
    throw util::InvalidArgument("queue name must not be empty");
  }
  if (queue.size() > kMaxQueueNameLength) {
    throw util::InvalidArgument("queue name '" + std::string(queue) + "' exceeds " + std::to_string(kMaxQueueNameLength) +
                                " characters");
  }
  for (char c : queue) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    if (!ok) {
      throw util::InvalidArgument("queue name '" + std::string(queue) + "' may only contain letters, digits and '_'");
    }
  }
}

bool IsDlqName(std::string_view queue) {
  return queue.size() > kDeadLetterSuffix.size() && queue.ends_with(kDeadLetterSuffix);
}

void ValidateSourceQueueName(std::string_view queue) {
  ValidateQueueName(queue);
  if (!IsDlqName(queue) && queue.size() > kMaxSourceQueueNameLength) {
    throw util::InvalidArgument("queue name '" + std::string(queue) + "' leaves no room for '" + std::string(kDeadLetterSuffix) +
                                "': at most " + std::to_string(kMaxSourceQueueNameLength) + " characters");
  }
}

std::string DlqName(std::string_view queue) {
  std::string name(queue);
  name += kDeadLetterSuffix;
  return name;
}

std::string QueueName(std::string_view prefix, std::string_view name) {
  if (prefix.empty()) {
    return std::string(name);
  }
  std::string out(prefix);
  out += '_';
  out += name;
  return out;
}

} // namespace unison::queue

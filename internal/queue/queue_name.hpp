#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace unison::queue {

// pgmq builds table names from queue names: q_<name> / a_<name>.
inline constexpr std::size_t kMaxQueueNameLength = 47;

inline constexpr std::string_view kDeadLetterSuffix = "_dlq";

// Longest work queue name whose <queue>_dlq still fits.
inline constexpr std::size_t kMaxSourceQueueNameLength = kMaxQueueNameLength - kDeadLetterSuffix.size();

// Throws util::InvalidArgument for names pgmq would reject.
void ValidateQueueName(std::string_view queue);

bool IsDlqName(std::string_view queue);

// ValidateQueueName, plus room for the dead-letter suffix unless `queue`
// already is a dead-letter queue.
void ValidateSourceQueueName(std::string_view queue);

// <queue>_dlq. Fixed, not configurable.
std::string DlqName(std::string_view queue);

// <prefix>_<name>, or `name` alone when the prefix is empty.
std::string QueueName(std::string_view prefix, std::string_view name);

} // namespace unison::queue

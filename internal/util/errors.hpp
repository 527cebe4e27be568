#pragma once

#include <stdexcept>
#include <string>

namespace unison::util {

/*
  Central error types.

  StoreUnavailable is the only error the retry policy lets through:
  it means the message store could not be reached or rejected the
  request, so queue state is unknown.
*/

class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& msg) : std::invalid_argument(msg) {
  }
};

} // namespace unison::util

#include "internal/util/parse.hpp"

#include <cerrno>
#include <cstdlib>

#include "internal/util/errors.hpp"

namespace unison::util {

int64_t ParsePositiveInt(const char* what, const std::string& text) {
  char* endptr = nullptr;
  errno        = 0;
  const auto parsed = std::strtoll(text.c_str(), &endptr, 10);

  if (text.empty() || endptr == nullptr || *endptr != '\0' || errno == ERANGE || parsed <= 0) {
    throw InvalidArgument(std::string(what) + " must be a positive integer, got '" + text + "'");
  }
  return static_cast<int64_t>(parsed);
}

} // namespace unison::util

#pragma once

#include <cstdint>
#include <string>

namespace unison::util {

// Whole-string base-10 parse of a value > 0. Throws util::InvalidArgument
// naming `what` on anything else, including overflow.
int64_t ParsePositiveInt(const char* what, const std::string& text);

} // namespace unison::util

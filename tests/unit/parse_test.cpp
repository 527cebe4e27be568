#include "internal/util/parse.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

bool Rejected(const std::string& text) {
  try {
    unison::util::ParsePositiveInt("vt_sec", text);
  } catch (const unison::util::InvalidArgument& e) {
    assert(std::string(e.what()).find("vt_sec") != std::string::npos);
    return true;
  }
  return false;
}

void TestAcceptsPositiveIntegers() {
  assert(unison::util::ParsePositiveInt("msg_id", "1") == 1);
  assert(unison::util::ParsePositiveInt("vt_sec", "30") == 30);
  assert(unison::util::ParsePositiveInt("msg_id", "9223372036854775807") == 9223372036854775807LL);
}

void TestRejectsEverythingElse() {
  assert(Rejected(""));
  assert(Rejected("abc"));
  assert(Rejected("30s"));
  assert(Rejected("3.5"));
  assert(Rejected("0"));
  assert(Rejected("-5"));
  assert(Rejected("99999999999999999999"));
}

} // namespace

int main() {
  TestAcceptsPositiveIntegers();
  TestRejectsEverythingElse();

  std::cout << "unison_unit_parse: pass\n";
  return 0;
}

#include "lexguard/phonetic.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

[[noreturn]] void test_fail(const char* expr, const char* file, int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr) \
  do { \
    if (!(expr)) { \
      test_fail(#expr, __FILE__, __LINE__); \
    } \
  } while (0)

using lexguard::PhoneticFolder;

void test_normalize_to_base() {
  PhoneticFolder folder;
  CHECK(folder.normalize_to_base("f@ck") == "fack");
  CHECK(folder.normalize_to_base("Sh1t") == "shit");
  CHECK(folder.normalize_to_base("b()b") == "bob");
  CHECK(folder.normalize_to_base("\U0001D41F\U0001D42E\U0001D41C\U0001D424") == "fuck");
  CHECK(folder.normalize_to_base("").empty());
}

void test_keys() {
  PhoneticFolder folder;
  CHECK(folder.max_len() == 8);

  CHECK(folder.key("fuck") == "fuk");
  CHECK(folder.key("phuck") == "fuk");
  CHECK(folder.key("knight") == "ngit");
  CHECK(folder.key("thumb") == "tum");
  CHECK(folder.key("shit") == "shit");
  CHECK(folder.key("school") == "shkol");
  CHECK(folder.key("Sh1t") == "shit");
  CHECK(folder.key("cat") == "kat");
  CHECK(folder.key("city") == "sity");
  CHECK(folder.key("wright") == "rgit");
  CHECK(folder.key("xyz") == "ksyz");
  CHECK(folder.key("damn") == "damn");
  CHECK(folder.key("quick") == "kiwk");
  CHECK(folder.key("hello") == "helo");
  CHECK(folder.key("f@ck") == "fak");
  CHECK(folder.key("3") == "e");
  CHECK(folder.key("").empty());
}

void test_middle_sort_and_truncation() {
  PhoneticFolder folder;
  CHECK(folder.key("shipment") == "sehimnpt");

  PhoneticFolder short_keys{lexguard::GlyphTables::shared(), 3};
  CHECK(short_keys.key("shipment") == "seh");
  CHECK(short_keys.key("fuck") == "fuk");
}

} // namespace

#undef CHECK

int main() {
  test_normalize_to_base();
  test_keys();
  test_middle_sort_and_truncation();

  std::cout << "OK\n";
  return 0;
}

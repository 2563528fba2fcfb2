#include "lexguard/context_whitelist.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

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

using lexguard::ContextWhitelist;
using lexguard::WhitelistRule;

void test_builtin_rules() {
  ContextWhitelist wl;
  CHECK(wl.rule_count() == 4);
  CHECK(wl.has_rules("ass"));
  CHECK(wl.has_rules("cunt"));
  CHECK(!wl.has_rules("fuck"));

  CHECK(wl.is_whitelisted("Please submit the assignment", "ass"));
  CHECK(wl.is_whitelisted("first-class ASSESSMENT", "ass"));
  CHECK(wl.is_whitelisted("I need to count the votes", "cunt"));
  CHECK(wl.is_whitelisted("a peacock in the garden", "cock"));
  CHECK(wl.is_whitelisted("Hello there", "hell"));

  CHECK(!wl.is_whitelisted("you are an ass", "ass"));
  CHECK(!wl.is_whitelisted("go to hell", "hell"));
  CHECK(!wl.is_whitelisted("Please submit the assignment", "fuck"));
  CHECK(!wl.is_whitelisted("", "ass"));
}

void test_custom_rules_skip_invalid_patterns() {
  const std::vector<WhitelistRule> rules = {
      {"duck", {"(unclosed", R"(\bduck\s+soup\b)"}, lexguard::kWhitelistTimeout},
      {"", {"anything"}, lexguard::kWhitelistTimeout},
  };
  ContextWhitelist wl{rules};

  CHECK(wl.rule_count() == 1);
  CHECK(wl.has_rules("duck"));
  CHECK(wl.is_whitelisted("Duck Soup is a film", "duck"));
  CHECK(!wl.is_whitelisted("duck and cover", "duck"));
}

void test_runaway_pattern_times_out() {
  using namespace std::chrono_literals;

  // Второй паттерн совпал бы, но исчерпанный бюджет означает отказ
  const std::vector<WhitelistRule> rules = {
      {"slow", {"(a+)+$", "!"}, 100ms},
  };
  ContextWhitelist wl{rules};

  const std::string message = std::string(64, 'a') + "!";
  const auto start = std::chrono::steady_clock::now();
  CHECK(!wl.is_whitelisted(message, "slow"));
  CHECK(std::chrono::steady_clock::now() - start < 5s);

  CHECK(wl.is_whitelisted("!", "slow"));
}

} // namespace

#undef CHECK

int main() {
  test_builtin_rules();
  test_custom_rules_skip_invalid_patterns();
  test_runaway_pattern_times_out();

  std::cout << "OK\n";
  return 0;
}

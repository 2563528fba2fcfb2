#include "lexguard/variant_expander.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

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

using lexguard::VariantExpander;

void test_expand_odometer_order() {
  VariantExpander ex;

  const auto all = ex.expand("a1", 10);
  const std::string_view expected[] = {"41", "4i", "4l", "a1", "ai", "al"};
  CHECK(all.size() == std::size(expected));
  for (std::size_t i = 0; i < all.size(); ++i) {
    CHECK(all[i] == expected[i]);
  }

  const auto capped = ex.expand("a1", 3);
  CHECK(capped.size() == 3);
  CHECK(capped[0] == "41");
  CHECK(capped[2] == "4l");

  CHECK(ex.expand("a1", 0).empty());
}

void test_unknown_code_points_pass_through() {
  VariantExpander ex;
  CHECK(ex.options_for(U'~').size() == 1);
  CHECK(ex.options_for(U'~').front() == U'~');

  const auto out = ex.expand("~~", 100);
  CHECK(out.size() == 1);
  CHECK(out[0] == "~~");
}

void test_expand_fullwidth_and_math_letters() {
  VariantExpander ex;
  // Каждый глиф математического алфавита сводится к одной букве
  const auto out = ex.expand("\U0001D41F\U0001D42E\U0001D41C\U0001D424", 10);
  CHECK(out.size() == 1);
  CHECK(out[0] == "fuck");
}

void test_can_produce_agrees_with_expand() {
  VariantExpander ex;
  const std::string_view tokens[] = {"a1", "$h!t", "f@ck", "5h1t", "@@@"};
  for (auto token : tokens) {
    for (std::size_t cap : {1u, 2u, 5u, 50u, 50000u}) {
      const auto all = ex.expand(token, 50000);
      const auto limited = ex.expand(token, cap);
      for (std::size_t i = 0; i < all.size(); ++i) {
        const bool in_limited = i < limited.size();
        CHECK(ex.can_produce(token, all[i], cap) == in_limited);
      }
    }
  }

  CHECK(ex.can_produce("5h1t", "shit", 50000));
  CHECK(ex.can_produce("f@ck", "fuck", 50000));
  CHECK(!ex.can_produce("f@ck", "fick", 50000));
  CHECK(!ex.can_produce("f@ck", "fuckk", 50000));
  CHECK(!ex.can_produce("abc", "abc", 0));
}

void test_star_heavy_token_is_bounded() {
  VariantExpander ex;
  const std::string stars(30, '*');
  const std::string target(30, 'z');

  const auto start = std::chrono::steady_clock::now();
  CHECK(ex.expand(stars, 50000).size() == 50000);
  // 22^30 комбинаций: ранг насыщается и не переполняется
  CHECK(!ex.can_produce(stars, target, 50000));
  CHECK(ex.can_produce(stars, std::string(30, '0'), 1));
  const auto elapsed = std::chrono::steady_clock::now() - start;
  CHECK(elapsed < std::chrono::seconds(5));
}

} // namespace

#undef CHECK

int main() {
  test_expand_odometer_order();
  test_unknown_code_points_pass_through();
  test_expand_fullwidth_and_math_letters();
  test_can_produce_agrees_with_expand();
  test_star_heavy_token_is_bounded();

  std::cout << "OK\n";
  return 0;
}

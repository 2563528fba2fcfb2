#include "lexguard/preprocessor.hpp"

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

using namespace lexguard;

void test_individual_steps() {
  const auto& tables = *GlyphTables::shared();

  CHECK(remove_hidden_separators("sh\u200Bi\u00ADt", tables) == "shit");
  CHECK(nfkc_normalize("ｆｕｃｋ") == "fuck");
  CHECK(nfkc_normalize("\U0001D41F") == "f");
  CHECK(fold_homoglyphs("ѕhit аss", tables) == "shit ass");
  CHECK(squash_repeats("aaabbbccc") == "abc");
  CHECK(squash_repeats("!!!  ") == "! ");
  CHECK(collapse_spaced_letters("f  u  c  k") == "fuck");
  CHECK(collapse_spaced_letters("F U C K off") == "FUCK off");
  CHECK(collapse_spaced_letters("ab c d") == "ab cd");
  CHECK(collapse_spaced_letters("I am") == "I am");
  CHECK(strip_non_alnum("f*u*c*k!") == "fuck");
  CHECK(strip_non_alnum("café ok") == "caf ok");
}

void test_pipeline() {
  CHECK(preprocess("heeellooo") == "helo");
  CHECK(preprocess("aaabbbccc") == "abc");
  CHECK(preprocess("f  u  c  k") == "fuck");
  CHECK(preprocess("Hello   World") == "helo world");
  CHECK(preprocess("ＦＵＣＫ") == "fuck");
  CHECK(preprocess("  spaced  ") == "spaced");
  CHECK(preprocess("a b") == "ab");
  CHECK(preprocess("x") == "x");
  CHECK(preprocess("sh\u200Bit") == "shit");
  CHECK(preprocess("ab c d") == "ab cd");
  CHECK(preprocess("f.u.c.k") == "fuck");
  CHECK(preprocess("5h1t") == "5h1t");
  CHECK(preprocess("").empty());
  CHECK(preprocess("!!! ???").empty());
}

void test_fixed_point() {
  const std::string inputs[] = {
      "a a a b",      "aa ab b",        "x  y  z  zz", "F.F.F u u",
      "hello  o  o",  "s h i i t",      "a-a a",       "аa a\u200Ba",
      "1 1 2 2 3",    "The  cat  sat",  "o o oo o",    "qｑ q",
  };
  for (const auto& input : inputs) {
    const std::string once = preprocess(input);
    CHECK(preprocess(once) == once);

    for (std::size_t i = 1; i < once.size(); ++i) {
      CHECK(once[i] != once[i - 1]);
    }
  }
}

void test_tokenize() {
  const auto tokens = tokenize("don't stop_me now");
  CHECK(tokens.size() == 3);
  CHECK(tokens[0] == "don't");
  CHECK(tokens[1] == "stop_me");
  CHECK(tokens[2] == "now");

  CHECK(tokenize("").empty());
  CHECK(tokenize("   ").empty());
  CHECK(tokenize("a").size() == 1);
}

} // namespace

#undef CHECK

int main() {
  test_individual_steps();
  test_pipeline();
  test_fixed_point();
  test_tokenize();

  std::cout << "OK\n";
  return 0;
}

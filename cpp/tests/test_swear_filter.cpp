#include "lexguard/swear_filter.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
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

using lexguard::MatchStage;
using lexguard::SwearFilter;

const std::vector<std::string> kBasicTerms = {"fuck", "shit", "damn"};

bool stage_is(const SwearFilter& f, const std::string& message, MatchStage stage) {
  const auto r = f.inspect(message);
  return r.stage == stage && r.matched == f.contains_banned_term(message);
}

std::uint64_t stage_hits(const SwearFilter& f, MatchStage stage) {
  return f.stats().stage_hits[static_cast<std::size_t>(stage)];
}

void test_raw_expansion() {
  SwearFilter f{kBasicTerms};
  const std::string blocked[] = {
      "fuck",        "f@ck",  "\U0001F175\U0001F184\U0001F172\U0001F17A",
      "$hit",        "sh!t",  "s#it",
      "5h1t",        "D4MN",  "ｆｕｃｋ",
      "\U0001D41F\U0001D42E\U0001D41C\U0001D424",
  };
  for (const auto& m : blocked) {
    CHECK(f.contains_banned_term(m));
    CHECK(stage_is(f, m, MatchStage::RawExpansion));
  }

  const auto r = f.inspect("well 5h1t happens");
  CHECK(r.matched);
  CHECK(r.term == "shit");
  CHECK(r.token == "5h1t");
}

void test_direct_after_normalization() {
  SwearFilter f{kBasicTerms};
  const std::string blocked[] = {
      "f*u*c*k", "f.u.c.k", "f u c k", "F U C K",
      "f\u200Buck", "fuuuuck", "ѕhit",
  };
  for (const auto& m : blocked) {
    CHECK(f.contains_banned_term(m));
    CHECK(stage_is(f, m, MatchStage::Direct));
  }
}

void test_root_suffix() {
  SwearFilter f{kBasicTerms};
  CHECK(stage_is(f, "fucking", MatchStage::RootSuffix));
  CHECK(stage_is(f, "motherfucker", MatchStage::RootSuffix));
  CHECK(stage_is(f, "fuckers", MatchStage::RootSuffix));
  CHECK(f.contains_banned_term("fucking"));

  SwearFilter shit_only{std::vector<std::string>{"shit"}};
  const auto r = shit_only.inspect("what a sh1tty day");
  CHECK(r.matched);
  CHECK(r.stage == MatchStage::RootSuffix);
  CHECK(r.token == "sh1ty");
}

void test_short_forms() {
  SwearFilter f{kBasicTerms};
  CHECK(stage_is(f, "d@mn!", MatchStage::ShortForm));
  CHECK(f.inspect("d@mn!").token == "dmn");
  CHECK(stage_is(f, "wtf", MatchStage::ShortForm));
  CHECK(stage_is(f, "WTF!", MatchStage::ShortForm));
  CHECK(stage_is(f, "k3k", MatchStage::ShortForm));
  CHECK(f.contains_banned_term("wtf"));

  SwearFilter fuck_only{std::vector<std::string>{"fuck"}};
  CHECK(fuck_only.contains_banned_term("cnt"));

  SwearFilter ass_only{std::vector<std::string>{"ass"}};
  CHECK(!ass_only.contains_banned_term("hi"));
  CHECK(!ass_only.contains_banned_term("ask me"));

  // Пустой список запрещённых слов не блокирует ничего
  SwearFilter empty{std::vector<std::string>{}};
  CHECK(!empty.contains_banned_term("wtf"));
  CHECK(!empty.contains_banned_term("fuck"));
}

void test_phonetic() {
  const std::vector<std::string> terms = {"fuck"};
  SwearFilter f{terms};
  CHECK(stage_is(f, "phuck", MatchStage::Phonetic));
  CHECK(f.contains_banned_term("phuck"));

  lexguard::FilterOptions options;
  options.phonetic_enabled = false;
  SwearFilter no_phonetic{terms, options};
  CHECK(!no_phonetic.contains_banned_term("phuck"));
}

void test_allowed_messages() {
  SwearFilter f{kBasicTerms};
  CHECK(!f.contains_banned_term(""));
  CHECK(stage_is(f, "", MatchStage::None));
  CHECK(stage_is(f, "hello world", MatchStage::SafeWord));
  CHECK(f.inspect("hello world").token == "helo");
  CHECK(stage_is(f, "the shipment arrived", MatchStage::SafeWord));
  CHECK(stage_is(f, "classic music", MatchStage::SafeWord));
  CHECK(stage_is(f, "have a nice day", MatchStage::None));
  CHECK(!f.contains_banned_term("have a nice day"));

  SwearFilter shit_only{std::vector<std::string>{"shit"}};
  CHECK(!shit_only.contains_banned_term("shipment s.h.i.t"));
}

void test_safe_words() {
  const std::vector<std::string> terms = {"fuck"};
  SwearFilter with_safe{terms, {}, std::vector<std::string>{"fuckery"}};
  CHECK(!with_safe.contains_banned_term("fuckery"));
  CHECK(stage_is(with_safe, "fuckery", MatchStage::SafeWord));

  SwearFilter no_safe{terms, {}, std::vector<std::string>{}};
  CHECK(no_safe.contains_banned_term("fuckery"));
  CHECK(stage_is(no_safe, "fuckery", MatchStage::RootSuffix));

  const std::vector<std::string> ass = {"ass"};
  SwearFilter assassin_safe{ass, {}, std::vector<std::string>{"assassin"}};
  CHECK(stage_is(assassin_safe, "assassin", MatchStage::SafeWord));
  SwearFilter assassin_plain{ass, {}, std::vector<std::string>{}};
  CHECK(stage_is(assassin_plain, "assassin", MatchStage::None));
}

void test_context_whitelist() {
  SwearFilter ass{std::vector<std::string>{"ass"}};
  CHECK(!ass.contains_banned_term("Please submit the assignment"));
  CHECK(ass.contains_banned_term("you are an ass"));

  SwearFilter cock{std::vector<std::string>{"cock"}};
  CHECK(!cock.contains_banned_term("c\u200Bock peacock"));

  SwearFilter hell{std::vector<std::string>{"hell"}};
  CHECK(hell.contains_banned_term("go to hell"));

  SwearFilter cunt{std::vector<std::string>{"cunt"}};
  CHECK(!cunt.contains_banned_term("I need to count the votes"));

  // Собственные правила заменяют встроенные
  const std::vector<lexguard::WhitelistRule> rules = {
      {"fuck", {R"(\bfu+ck\s+yeah\b)"}, lexguard::kWhitelistTimeout},
  };
  std::shared_ptr<const lexguard::ContextWhitelist> custom =
      std::make_shared<lexguard::ContextWhitelist>(rules);
  SwearFilter f{std::vector<std::string>{"fuck"}, {}, std::vector<std::string>{},
                custom};
  CHECK(!f.contains_banned_term("fuuuck yeah"));
  CHECK(f.contains_banned_term("fuuuck off"));
}

void test_cache_and_stats() {
  SwearFilter f{kBasicTerms};
  CHECK(f.cache_size() == 0);

  CHECK(f.contains_banned_term("f@ck"));
  CHECK(f.contains_banned_term("f@ck"));
  CHECK(!f.contains_banned_term("hello world"));
  CHECK(!f.contains_banned_term("hello world"));

  const auto s = f.stats();
  CHECK(s.cache_misses == 2);
  CHECK(s.cache_hits == 2);
  CHECK(s.pipeline_runs == 2);
  CHECK(stage_hits(f, MatchStage::RawExpansion) == 1);
  CHECK(stage_hits(f, MatchStage::SafeWord) == 1);
  CHECK(f.cache_size() == 2);

  lexguard::FilterOptions small;
  small.cache_size = 1;
  SwearFilter g{kBasicTerms, small};
  CHECK(g.contains_banned_term("fuck"));
  CHECK(!g.contains_banned_term("nice"));
  CHECK(g.cache_size() == 1);
  CHECK(g.options().cache_size == 1);
}

void test_inspect_does_not_touch_stats() {
  SwearFilter f{kBasicTerms};
  const auto r = f.inspect("f@ck");
  CHECK(r.matched);
  CHECK(f.inspect("hello world").stage == MatchStage::SafeWord);

  auto s = f.stats();
  CHECK(s.pipeline_runs == 0);
  CHECK(stage_hits(f, MatchStage::RawExpansion) == 0);
  CHECK(f.cache_size() == 0);

  // Проверка с разбором, как в --explain: один прогон на сообщение
  CHECK(f.contains_banned_term("f@ck"));
  (void)f.inspect("f@ck");
  s = f.stats();
  CHECK(s.pipeline_runs == 1);
  CHECK(stage_hits(f, MatchStage::RawExpansion) == 1);
}

void test_update_terms_during_checks() {
  SwearFilter f{std::vector<std::string>{"fuck"}};
  std::atomic<bool> done{false};

  std::thread checker([&] {
    while (!done.load()) {
      (void)f.contains_banned_term("damn it");
    }
  });

  f.update_terms(std::vector<std::string>{"damn"});
  done.store(true);
  checker.join();

  // После обновления старый вердикт не может оставаться в кеше
  CHECK(f.contains_banned_term("damn it"));
}

void test_batch_and_matched_terms() {
  SwearFilter f{kBasicTerms};
  const std::vector<std::string> messages = {"fuck", "hello", "fuck", "d@mn!"};
  const auto results = f.test_batch(messages);
  CHECK(results.size() == 3);
  CHECK(results[0].first == "fuck" && results[0].second);
  CHECK(results[1].first == "hello" && !results[1].second);
  CHECK(results[2].first == "d@mn!" && results[2].second);

  const auto terms = f.matched_terms("f.u.c.k and 5h1t");
  CHECK(terms.size() == 2);
  CHECK(terms[0] == "fuck");
  CHECK(terms[1] == "shit");
  CHECK(f.matched_terms("have a nice day").empty());
  CHECK(f.matched_terms("fuckshit").empty());
}

void test_explain_normalization() {
  SwearFilter f{kBasicTerms};

  const auto steps = f.explain_normalization("5h1t");
  CHECK(steps.size() == 2);
  CHECK(steps[0].position == 0);
  CHECK(steps[0].glyph == "5");
  CHECK(steps[0].canonical == 's');
  CHECK(steps[0].code_point == "U+0035");
  CHECK(steps[1].position == 2);
  CHECK(steps[1].canonical == 'i');

  const auto at = f.explain_normalization("f@ck");
  CHECK(at.size() == 1);
  CHECK(at[0].position == 1);
  CHECK(at[0].canonical == 'a');
  CHECK(at[0].code_point == "U+0040");

  CHECK(f.explain_normalization("plain").empty());
}

void test_update_terms() {
  SwearFilter f{std::vector<std::string>{"fuck", " FUCK "}};
  CHECK(f.banned_terms().size() == 1);
  CHECK(!f.contains_banned_term("damn it"));
  CHECK(f.contains_banned_term("fuck"));
  CHECK(f.cache_size() == 2);

  f.update_terms(std::vector<std::string>{"damn"});
  CHECK(f.cache_size() == 0);
  CHECK(f.banned_terms() == std::vector<std::string>{"damn"});
  CHECK(f.contains_banned_term("damn it"));
  CHECK(!f.contains_banned_term("fuck"));
}

void test_concurrent_checks() {
  SwearFilter f{kBasicTerms};
  const std::vector<std::pair<std::string, bool>> cases = {
      {"f@ck", true},        {"hello world", false}, {"fucking", true},
      {"have a nice day", false}, {"wtf", true},     {"5h1t", true},
  };

  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (int round = 0; round < 50; ++round) {
        for (const auto& [message, expected] : cases) {
          if (f.contains_banned_term(message) != expected) {
            failures.fetch_add(1);
          }
        }
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }
  CHECK(failures.load() == 0);

  const auto s = f.stats();
  CHECK(s.cache_hits + s.cache_misses == 4u * 50u * cases.size());
}

} // namespace

#undef CHECK

int main() {
  test_raw_expansion();
  test_direct_after_normalization();
  test_root_suffix();
  test_short_forms();
  test_phonetic();
  test_allowed_messages();
  test_safe_words();
  test_context_whitelist();
  test_cache_and_stats();
  test_inspect_does_not_touch_stats();
  test_batch_and_matched_terms();
  test_explain_normalization();
  test_update_terms();
  test_update_terms_during_checks();
  test_concurrent_checks();

  std::cout << "OK\n";
  return 0;
}

#include "lexguard/config.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
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

namespace fs = std::filesystem;

fs::path write_temp(const std::string& name, const std::string& content) {
  const fs::path path = fs::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path;
}

void test_defaults() {
  const Config config;
  CHECK(config.filter.cache_size == kDefaultCacheSize);
  CHECK(config.filter.raw_token_cap == kRawExpansionCap);
  CHECK(config.filter.segment_cap == kSegmentExpansionCap);
  CHECK(config.filter.phonetic_enabled);
  CHECK(!config.filter.verbose);
  CHECK(config.lists.banned_terms.empty());
  CHECK(validate_config(config));
}

void test_load_full_config() {
  const fs::path path = write_temp("lexguard_test_config.yaml",
                                   "# lexguard\n"
                                   "cache:\n"
                                   "  max_entries: 250\n"
                                   "\n"
                                   "expansion:\n"
                                   "  raw_token_cap: 1000 # per token\n"
                                   "  segment_cap: 500\n"
                                   "matching:\n"
                                   "  root_min_term_len: 4\n"
                                   "  max_suffix_len: 2\n"
                                   "  short_form_max_len: 2\n"
                                   "  phonetic_enabled: false\n"
                                   "  phonetic_key_len: 6\n"
                                   "whitelist:\n"
                                   "  timeout_ms: 250\n"
                                   "lists:\n"
                                   "  banned_terms: \"/tmp/banned.txt\"\n"
                                   "  safe_words: '/usr/share/dict/words.dic'\n"
                                   "logging:\n"
                                   "  verbose: yes\n"
                                   "unknown:\n"
                                   "  key: value\n");

  const auto outcome = load_config_checked(path);
  CHECK(outcome.result == ConfigResult::Ok);
  CHECK(outcome.error.empty());

  const auto& f = outcome.config.filter;
  CHECK(f.cache_size == 250);
  CHECK(f.raw_token_cap == 1000);
  CHECK(f.segment_cap == 500);
  CHECK(f.root_min_term_len == 4);
  CHECK(f.max_suffix_len == 2);
  CHECK(f.short_form_max_len == 2);
  CHECK(!f.phonetic_enabled);
  CHECK(f.phonetic_key_len == 6);
  CHECK(f.whitelist_timeout == std::chrono::milliseconds{250});
  CHECK(f.verbose);
  CHECK(outcome.config.lists.banned_terms == "/tmp/banned.txt");
  CHECK(outcome.config.lists.safe_words == "/usr/share/dict/words.dic");
  CHECK(outcome.config.config_path == path);

  fs::remove(path);
}

void test_parse_error_names_key() {
  const fs::path path = write_temp("lexguard_test_bad.yaml",
                                   "cache:\n"
                                   "  max_entries: lots\n");
  const auto outcome = load_config_checked(path);
  CHECK(outcome.result == ConfigResult::ParseError);
  CHECK(outcome.error.find("cache.max_entries") != std::string::npos);
  CHECK(outcome.error.find("line 2") != std::string::npos);
  fs::remove(path);
}

void test_invalid_value() {
  const fs::path path = write_temp("lexguard_test_invalid.yaml",
                                   "expansion:\n"
                                   "  raw_token_cap: 0\n");
  const auto outcome = load_config_checked(path);
  CHECK(outcome.result == ConfigResult::InvalidValue);
  CHECK(outcome.config.filter.raw_token_cap == kRawExpansionCap);
  fs::remove(path);
}

void test_missing_file() {
  const fs::path missing = fs::temp_directory_path() / "lexguard_no_such.yaml";
  const auto outcome = load_config_checked(missing);
  CHECK(outcome.result == ConfigResult::FileNotFound);
  CHECK(!outcome.error.empty());

  CHECK(load_config_checked("").result == ConfigResult::FileNotFound);

  // Best-effort загрузка возвращает дефолты
  const Config config = load_config(missing.string());
  CHECK(config.filter.cache_size == kDefaultCacheSize);
}

void test_parse_timeout_ms() {
  CHECK(parse_timeout_ms("1500") == std::chrono::milliseconds{1500});
  CHECK(!parse_timeout_ms("0").has_value());
  CHECK(!parse_timeout_ms("-5").has_value());
  CHECK(!parse_timeout_ms("soon").has_value());
}

void test_validate_limits() {
  Config config;
  config.filter.segment_cap = 20'000'000;
  CHECK(!validate_config(config));

  config = Config{};
  config.filter.cache_size = 0;
  CHECK(!validate_config(config));

  config = Config{};
  config.filter.phonetic_key_len = 0;
  CHECK(!validate_config(config));

  config = Config{};
  config.filter.whitelist_timeout = std::chrono::milliseconds{60'000};
  CHECK(validate_config(config));
  config.filter.whitelist_timeout = std::chrono::milliseconds{60'001};
  CHECK(!validate_config(config));
}

void test_oversized_timeout_rejected() {
  // 2^31 мс не помещается в int32_t лимит ICU
  const fs::path path = write_temp("lexguard_test_timeout.yaml",
                                   "whitelist:\n"
                                   "  timeout_ms: 2147483648\n");
  const auto outcome = load_config_checked(path);
  CHECK(outcome.result == ConfigResult::InvalidValue);
  CHECK(outcome.config.filter.whitelist_timeout == kWhitelistTimeout);
  fs::remove(path);
}

} // namespace

#undef CHECK

int main() {
  test_defaults();
  test_load_full_config();
  test_parse_error_names_key();
  test_invalid_value();
  test_missing_file();
  test_parse_timeout_ms();
  test_validate_limits();
  test_oversized_timeout_rejected();

  std::cout << "OK\n";
  return 0;
}

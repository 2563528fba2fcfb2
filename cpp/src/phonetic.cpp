/**
 * @file phonetic.cpp
 * @brief Реализация фонетического ключа
 */

#include "lexguard/phonetic.hpp"
#include "lexguard/text_utils.hpp"

#include <unicode/regex.h>

#include <algorithm>
#include <iostream>
#include <vector>

namespace lexguard {

namespace {

struct RewriteRule {
  const char16_t *pattern;
  const char16_t *replacement;
};

// Порядок правил важен: каждое применяется к результату предыдущего
// clang-format off
constexpr RewriteRule kRewriteRules[] = {
    {u"[^a-z]",             u""},
    {u"([aeiou])h",         u"$1"},
    {u"gh(?=[iey])",        u""},
    {u"ck",                 u"k"},
    {u"c(?!e|i|y)",         u"k"},
    {u"ph",                 u"f"},
    {u"qu",                 u"kw"},
    {u"x",                  u"ks"},
    {u"(\\w)\\1+",          u"$1"},
    {u"sch",                u"sk"},
    {u"th",                 u"t"},
    {u"^kn",                u"n"},
    {u"^gn",                u"n"},
    {u"^pn",                u"n"},
    {u"^wr",                u"r"},
    {u"mb$",                u"m"},
    {u"([^s]|^)c(?=[iey])", u"$1s"},
    {u"([^f]|^)gh",         u"$1g"},
    {u"([^t]|^)ch",         u"$1k"},
};
// clang-format on

struct CompiledRule {
  std::unique_ptr<icu::RegexPattern> pattern;
  icu::UnicodeString replacement;
};

/// Lazy-initialized скомпилированные правила (общие для всех экземпляров)
const std::vector<CompiledRule> &compiled_rules() {
  static const auto rules = [] {
    std::vector<CompiledRule> out;
    for (const auto &rule : kRewriteRules) {
      UErrorCode status = U_ZERO_ERROR;
      UParseError parse_error{};
      std::unique_ptr<icu::RegexPattern> p{icu::RegexPattern::compile(
          icu::UnicodeString(rule.pattern), 0, parse_error, status)};
      if (U_FAILURE(status)) {
        std::cerr << "[lexguard] Skipping phonetic rule at offset "
                  << parse_error.offset << ": " << u_errorName(status) << "\n";
        continue;
      }
      out.push_back(
          CompiledRule{std::move(p), icu::UnicodeString(rule.replacement)});
    }
    return out;
  }();
  return rules;
}

} // namespace

PhoneticFolder::PhoneticFolder(std::shared_ptr<const GlyphTables> tables,
                               std::size_t max_len)
    : tables_(std::move(tables)), max_len_(max_len) {}

std::string PhoneticFolder::normalize_to_base(std::string_view text) const {
  const std::string lower = to_lower(text);
  const std::size_t max_bytes = tables_->max_glyph_bytes();

  std::string out;
  out.reserve(lower.size());

  std::size_t i = 0;
  while (i < lower.size()) {
    // Границы кодовых точек, начиная с i, в пределах самого длинного глифа
    std::vector<std::size_t> ends;
    std::size_t j = i;
    while (j < lower.size() && j - i < max_bytes) {
      std::size_t len = utf8_char_len(static_cast<unsigned char>(lower[j]));
      if (len == 0 || j + len > lower.size()) {
        len = 1;
      }
      j += len;
      if (j - i <= max_bytes) {
        ends.push_back(j);
      }
    }

    bool replaced = false;
    for (auto it = ends.rbegin(); it != ends.rend(); ++it) {
      if (auto base = tables_->canonical_of(
              std::string_view(lower).substr(i, *it - i))) {
        out += *base;
        i = *it;
        replaced = true;
        break;
      }
    }

    if (!replaced) {
      const std::size_t step = ends.empty() ? 1 : ends.front() - i;
      out.append(lower, i, step);
      i += step;
    }
  }

  return out;
}

std::string PhoneticFolder::key(std::string_view text) const {
  icu::UnicodeString s = to_icu(normalize_to_base(text));

  for (const auto &rule : compiled_rules()) {
    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString rewritten;
    {
      std::unique_ptr<icu::RegexMatcher> matcher{
          rule.pattern->matcher(s, status)};
      if (U_SUCCESS(status)) {
        rewritten = matcher->replaceAll(rule.replacement, status);
      }
    }
    if (U_FAILURE(status)) {
      std::cerr << "[lexguard] Phonetic rewrite failed: "
                << u_errorName(status) << "\n";
      continue;
    }
    s = std::move(rewritten);
  }

  // После первого правила строка состоит только из [a-z]
  std::string result = from_icu(s);
  if (result.size() >= 4) {
    std::sort(result.begin() + 1, result.end() - 1);
  }
  if (result.size() > max_len_) {
    result.resize(max_len_);
  }
  return result;
}

} // namespace lexguard

/**
 * @file preprocessor.cpp
 * @brief Реализация конвейера нормализации
 */

#include "lexguard/preprocessor.hpp"
#include "lexguard/text_utils.hpp"

#include <unicode/normalizer2.h>
#include <unicode/regex.h>
#include <unicode/uchar.h>
#include <unicode/utf16.h>

#include <iostream>
#include <memory>

namespace lexguard {

namespace {

/// Одиночные буквы через пробел, с границами слова
constexpr char16_t kSpacedLettersPattern[] = u"\\b(?:[a-z]\\s+)+[a-z]\\b";

/// Lazy-initialized паттерн для склейки одиночных букв
const icu::RegexPattern *spaced_letters_pattern() {
  static const std::unique_ptr<icu::RegexPattern> pattern = [] {
    UErrorCode status = U_ZERO_ERROR;
    UParseError parse_error{};
    std::unique_ptr<icu::RegexPattern> p{icu::RegexPattern::compile(
        icu::UnicodeString(kSpacedLettersPattern), UREGEX_CASE_INSENSITIVE,
        parse_error, status)};
    if (U_FAILURE(status)) {
      std::cerr << "[lexguard] Failed to compile spaced-letters pattern: "
                << u_errorName(status) << "\n";
      return std::unique_ptr<icu::RegexPattern>{};
    }
    return p;
  }();
  return pattern.get();
}

bool is_ascii_alnum(char32_t cp) {
  return (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z') ||
         (cp >= U'0' && cp <= U'9');
}

bool is_word_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '_' || c == '\'';
}

} // namespace

std::string remove_hidden_separators(std::string_view text,
                                     const GlyphTables &tables) {
  std::string out;
  out.reserve(text.size());
  for (char32_t cp : decode_utf8(text)) {
    if (!tables.is_hidden_separator(cp)) {
      append_utf8(out, cp);
    }
  }
  return out;
}

std::string nfkc_normalize(std::string_view text) {
  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2 *nfkc = icu::Normalizer2::getNFKCInstance(status);
  if (U_FAILURE(status)) {
    std::cerr << "[lexguard] NFKC unavailable: " << u_errorName(status) << "\n";
    return std::string{text};
  }

  icu::UnicodeString normalized = nfkc->normalize(to_icu(text), status);
  if (U_FAILURE(status)) {
    std::cerr << "[lexguard] NFKC failed: " << u_errorName(status) << "\n";
    return std::string{text};
  }

  return from_icu(normalized);
}

std::string fold_homoglyphs(std::string_view text, const GlyphTables &tables) {
  std::string out;
  out.reserve(text.size());
  for (char32_t cp : decode_utf8(text)) {
    if (auto latin = tables.homoglyph_of(cp)) {
      out += *latin;
    } else {
      append_utf8(out, cp);
    }
  }
  return out;
}

std::string squash_repeats(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  bool has_prev = false;
  char32_t prev = 0;
  for (char32_t cp : decode_utf8(text)) {
    if (has_prev && cp == prev) {
      continue;
    }
    append_utf8(out, cp);
    prev = cp;
    has_prev = true;
  }
  return out;
}

std::string collapse_spaced_letters(std::string_view text) {
  const icu::RegexPattern *pattern = spaced_letters_pattern();
  if (pattern == nullptr || text.empty()) {
    return std::string{text};
  }

  const icu::UnicodeString input = to_icu(text);
  UErrorCode status = U_ZERO_ERROR;
  std::unique_ptr<icu::RegexMatcher> matcher{pattern->matcher(input, status)};
  if (U_FAILURE(status)) {
    std::cerr << "[lexguard] Spaced-letters matcher failed: "
              << u_errorName(status) << "\n";
    return std::string{text};
  }

  icu::UnicodeString out;
  int32_t last = 0;
  while (matcher->find(status) && U_SUCCESS(status)) {
    const int32_t start = matcher->start(status);
    const int32_t end = matcher->end(status);
    if (U_FAILURE(status)) {
      break;
    }

    out.append(input, last, start - last);
    for (int32_t i = start; i < end;) {
      const UChar32 c = input.char32At(i);
      if (!u_isUWhiteSpace(c)) {
        out.append(c);
      }
      i += U16_LENGTH(c);
    }
    last = end;
  }

  if (U_FAILURE(status)) {
    std::cerr << "[lexguard] Spaced-letters scan failed: "
              << u_errorName(status) << "\n";
    return std::string{text};
  }

  out.append(input, last, input.length() - last);
  return from_icu(out);
}

std::string strip_non_alnum(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char32_t cp : decode_utf8(text)) {
    if (is_ascii_alnum(cp) || is_unicode_space(cp)) {
      append_utf8(out, cp);
    }
  }
  return out;
}

std::string preprocess_once(std::string_view text, const GlyphTables &tables) {
  std::string s = remove_hidden_separators(text, tables);
  s = nfkc_normalize(s);
  s = fold_homoglyphs(s, tables);
  s = squash_repeats(s);
  s = collapse_spaced_letters(s);
  s = strip_non_alnum(s);
  return trim(to_lower(s));
}

std::string preprocess(std::string_view text, const GlyphTables &tables) {
  if (text.empty()) {
    return {};
  }

  std::string current = preprocess_once(text, tables);

  // Каждый проход не удлиняет текст; неподвижная точка достигается не
  // позднее чем за size() проходов
  for (std::size_t pass = 0; pass <= current.size(); ++pass) {
    std::string next = preprocess_once(current, tables);
    if (next == current) {
      break;
    }
    current = std::move(next);
  }

  return current;
}

std::string preprocess(std::string_view text) {
  return preprocess(text, *GlyphTables::shared());
}

std::vector<std::string> tokenize(std::string_view normalized) {
  std::vector<std::string> tokens;
  std::size_t i = 0;
  while (i < normalized.size()) {
    while (i < normalized.size() && !is_word_char(normalized[i])) {
      ++i;
    }
    const std::size_t start = i;
    while (i < normalized.size() && is_word_char(normalized[i])) {
      ++i;
    }
    if (i > start) {
      tokens.emplace_back(normalized.substr(start, i - start));
    }
  }
  return tokens;
}

} // namespace lexguard

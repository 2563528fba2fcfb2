/**
 * @file text_utils.cpp
 * @brief Реализация UTF-8 утилит
 */

#include "lexguard/text_utils.hpp"

#include <unicode/locid.h>
#include <unicode/uchar.h>

#include <cstdio>

namespace lexguard {

namespace {

/// Проверяет continuation byte (10xxxxxx)
constexpr bool is_continuation(unsigned char b) noexcept {
  return (b & 0xC0) == 0x80;
}

} // namespace

std::u32string decode_utf8(std::string_view text) {
  std::u32string out;
  out.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    const auto b0 = static_cast<unsigned char>(text[i]);
    const std::size_t len = utf8_char_len(b0);

    if (len == 0 || i + len > text.size()) {
      out.push_back(kReplacementChar);
      ++i;
      continue;
    }

    char32_t cp = 0;
    switch (len) {
    case 1:
      cp = b0;
      break;
    case 2:
      cp = b0 & 0x1F;
      break;
    case 3:
      cp = b0 & 0x0F;
      break;
    default:
      cp = b0 & 0x07;
      break;
    }

    bool valid = true;
    for (std::size_t k = 1; k < len; ++k) {
      const auto b = static_cast<unsigned char>(text[i + k]);
      if (!is_continuation(b)) {
        valid = false;
        break;
      }
      cp = (cp << 6) | (b & 0x3F);
    }

    if (!valid) {
      out.push_back(kReplacementChar);
      ++i;
      continue;
    }

    out.push_back(cp);
    i += len;
  }

  return out;
}

void append_utf8(std::string &out, char32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x110000) {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    append_utf8(out, kReplacementChar);
  }
}

std::string encode_utf8(std::u32string_view cps) {
  std::string out;
  out.reserve(cps.size());
  for (char32_t cp : cps) {
    append_utf8(out, cp);
  }
  return out;
}

std::size_t code_point_count(std::string_view text) {
  std::size_t count = 0;
  for (char c : text) {
    if (!is_continuation(static_cast<unsigned char>(c))) {
      ++count;
    }
  }
  return count;
}

icu::UnicodeString to_icu(std::string_view text) {
  return icu::UnicodeString::fromUTF8(
      icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
}

std::string from_icu(const icu::UnicodeString &text) {
  std::string out;
  text.toUTF8String(out);
  return out;
}

std::string to_lower(std::string_view text) {
  icu::UnicodeString u = to_icu(text);
  u.toLower(icu::Locale::getRoot());
  return from_icu(u);
}

std::string to_upper(std::string_view text) {
  icu::UnicodeString u = to_icu(text);
  u.toUpper(icu::Locale::getRoot());
  return from_icu(u);
}

bool is_unicode_space(char32_t cp) noexcept {
  return u_isUWhiteSpace(static_cast<UChar32>(cp)) != 0;
}

std::string trim(std::string_view text) {
  std::u32string cps = decode_utf8(text);

  std::size_t begin = 0;
  std::size_t end = cps.size();
  while (begin < end && is_unicode_space(cps[begin])) {
    ++begin;
  }
  while (end > begin && is_unicode_space(cps[end - 1])) {
    --end;
  }

  return encode_utf8(std::u32string_view(cps).substr(begin, end - begin));
}

std::vector<std::string> split_whitespace(std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;

  for (char32_t cp : decode_utf8(text)) {
    if (is_unicode_space(cp)) {
      if (!current.empty()) {
        tokens.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    append_utf8(current, cp);
  }

  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }

  return tokens;
}

std::string format_code_point(char32_t cp) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(cp));
  return buf;
}

} // namespace lexguard

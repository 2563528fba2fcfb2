/**
 * @file term_list.cpp
 * @brief Реализация загрузки списков слов
 */

#include "lexguard/term_list.hpp"
#include "lexguard/substitution_data.hpp"
#include "lexguard/text_utils.hpp"

#include <fstream>
#include <iostream>
#include <unordered_set>

namespace lexguard {

namespace {

/// Максимальная длина «хвоста» у продолжения запрещённого слова
constexpr std::size_t kVariantTailLen = 3;

/// Извлекает слово из строки hunspell (формат: word/flags)
std::string extract_word(const std::string &line) {
  auto slash_pos = line.find('/');
  if (slash_pos != std::string::npos) {
    return line.substr(0, slash_pos);
  }
  return line;
}

bool is_all_digits(std::string_view s) {
  if (s.empty()) {
    return false;
  }
  for (char c : s) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

bool is_split_char(char c) {
  return c == ',' || c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
         c == '\f' || c == '\v';
}

} // namespace

std::vector<std::string> normalize_terms(std::span<const std::string> terms) {
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  out.reserve(terms.size());

  for (const auto &term : terms) {
    std::string normalized = trim(to_lower(term));
    if (normalized.empty()) {
      continue;
    }
    if (seen.insert(normalized).second) {
      out.push_back(std::move(normalized));
    }
  }

  return out;
}

std::vector<std::string> split_words(std::string_view input) {
  std::string text;
  text.reserve(input.size());
  for (char c : to_lower(input)) {
    if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || is_split_char(c)) {
      text += c;
    }
  }

  std::vector<std::string> words;
  std::unordered_set<std::string> seen;
  std::string current;
  for (char c : text) {
    if (is_split_char(c)) {
      if (!current.empty() && seen.insert(current).second) {
        words.push_back(current);
      }
      current.clear();
      continue;
    }
    current += c;
  }
  if (!current.empty() && seen.insert(current).second) {
    words.push_back(current);
  }

  return words;
}

std::optional<std::vector<std::string>>
load_term_file(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return std::nullopt;
  }

  std::vector<std::string> terms;
  std::unordered_set<std::string> seen;
  std::string line;
  while (std::getline(file, line)) {
    const std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    for (auto &word : split_words(trimmed)) {
      if (seen.insert(word).second) {
        terms.push_back(std::move(word));
      }
    }
  }

  return terms;
}

bool is_banned_variant(std::string_view word,
                       std::span<const std::string> banned) {
  for (const auto &term : banned) {
    if (word == term) {
      return true;
    }
    if (word.starts_with(term) && word.size() - term.size() <= kVariantTailLen) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> builtin_safe_words_list() {
  std::vector<std::string> out;
  for (std::string_view w : builtin_safe_words()) {
    out.emplace_back(w);
  }
  return out;
}

std::vector<std::string> load_safe_words(const std::filesystem::path &path,
                                         std::span<const std::string> banned) {
  std::vector<std::string> words = builtin_safe_words_list();

  std::ifstream file(path);
  if (!file.is_open()) {
    std::cerr << "[lexguard] Warning: safe words list not found: " << path
              << " (using built-in list only)\n";
    return words;
  }

  // Определяем формат файла: hunspell (.dic) или plain text
  const bool is_hunspell = path.extension() == ".dic";

  std::unordered_set<std::string> seen(words.begin(), words.end());
  std::string line;
  std::size_t loaded = 0;
  bool first_line = true;

  while (std::getline(file, line)) {
    std::string word = trim(to_lower(is_hunspell ? extract_word(line) : line));

    // Первая строка hunspell: количество слов
    if (first_line) {
      first_line = false;
      if (is_hunspell && is_all_digits(word)) {
        continue;
      }
    }

    if (word.empty() || is_banned_variant(word, banned)) {
      continue;
    }
    if (seen.insert(word).second) {
      words.push_back(std::move(word));
      ++loaded;
    }
  }

  std::cerr << "[lexguard] Loaded safe words: " << path << " (+" << loaded
            << " words)\n";
  return words;
}

} // namespace lexguard

/**
 * @file swear_filter.cpp
 * @brief Реализация конвейера сопоставления
 */

#include "lexguard/swear_filter.hpp"
#include "lexguard/preprocessor.hpp"
#include "lexguard/substitution_data.hpp"
#include "lexguard/term_list.hpp"
#include "lexguard/text_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <iostream>

namespace lexguard {

namespace {

/// Разделитель между буквами в паттерне маскировки
constexpr std::string_view kLetterGap = "[\\W_]*";

/// Экранирует строку для ICU regex посимвольно (\x{HHHH})
std::string escape_regex(std::string_view text) {
  std::string out;
  char buf[16];
  for (char32_t cp : decode_utf8(text)) {
    std::snprintf(buf, sizeof(buf), "\\x{%X}", static_cast<unsigned>(cp));
    out += buf;
  }
  return out;
}

/// Lazy-initialized таблица сокращений
const std::unordered_set<std::string_view> &short_forms() {
  static const auto set = [] {
    std::unordered_set<std::string_view> s;
    for (std::string_view w : short_form_terms()) {
      s.insert(w);
    }
    return s;
  }();
  return set;
}

} // namespace

// ===========================================================================
// Построение
// ===========================================================================

SwearFilter::SwearFilter(std::span<const std::string> banned_terms,
                         FilterOptions options,
                         std::optional<std::vector<std::string>> safe_words,
                         std::shared_ptr<const ContextWhitelist> whitelist,
                         std::shared_ptr<const GlyphTables> tables)
    : options_(options), tables_(std::move(tables)),
      whitelist_(std::move(whitelist)), expander_(tables_),
      phonetic_(tables_, options.phonetic_key_len),
      cache_(options.cache_size) {
  if (!whitelist_) {
    whitelist_ = std::make_shared<ContextWhitelist>(options_.whitelist_timeout);
  }

  const std::vector<std::string> safe =
      safe_words ? std::move(*safe_words) : builtin_safe_words_list();
  for (const auto &word : safe) {
    std::string normalized = preprocess(word, *tables_);
    if (!normalized.empty()) {
      safe_words_.insert(std::move(normalized));
    }
  }

  state_ = build_state(banned_terms);

  std::cerr << "[lexguard] Filter ready: " << state_->terms.size()
            << " banned terms, " << safe_words_.size() << " safe words, "
            << whitelist_->rule_count() << " whitelist rules\n";
}

std::unique_ptr<icu::RegexPattern>
SwearFilter::compile_term_pattern(const std::string &term) const {
  std::string body;
  bool first = true;

  for (char32_t cp : decode_utf8(term)) {
    if (!first) {
      body += kLetterGap;
    }
    first = false;

    std::span<const std::string> variants;
    if (cp < 0x80) {
      variants = tables_->variants_of(static_cast<char>(cp));
    }

    if (variants.empty()) {
      std::string single;
      append_utf8(single, cp);
      body += escape_regex(single);
      continue;
    }

    // Длинные варианты первыми, чтобы "()" не проигрывал "("
    std::vector<std::string> ordered(variants.begin(), variants.end());
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const std::string &a, const std::string &b) {
                       return code_point_count(a) > code_point_count(b);
                     });

    body += "(?:";
    for (std::size_t i = 0; i < ordered.size(); ++i) {
      if (i > 0) {
        body += '|';
      }
      body += escape_regex(ordered[i]);
    }
    body += ')';
  }

  const std::string full = "(?<!\\w)" + body + "(?!\\w)";

  UErrorCode status = U_ZERO_ERROR;
  UParseError parse_error{};
  std::unique_ptr<icu::RegexPattern> pattern{icu::RegexPattern::compile(
      to_icu(full), UREGEX_CASE_INSENSITIVE, parse_error, status)};
  if (U_SUCCESS(status)) {
    return pattern;
  }

  std::cerr << "[lexguard] Pattern for '" << term
            << "' failed to compile (" << u_errorName(status)
            << "), falling back to literal match\n";

  status = U_ZERO_ERROR;
  pattern.reset(icu::RegexPattern::compile(
      to_icu(term), UREGEX_CASE_INSENSITIVE | UREGEX_LITERAL, parse_error,
      status));
  if (U_FAILURE(status)) {
    std::cerr << "[lexguard] Literal pattern for '" << term
              << "' failed: " << u_errorName(status) << "\n";
    return nullptr;
  }
  return pattern;
}

std::shared_ptr<const SwearFilter::TermState>
SwearFilter::build_state(std::span<const std::string> banned_terms) const {
  auto state = std::make_shared<TermState>();

  for (auto &term : normalize_terms(banned_terms)) {
    CompiledTerm compiled;
    compiled.length = code_point_count(term);
    compiled.pattern = compile_term_pattern(term);
    compiled.phonetic_key = phonetic_.key(term);
    compiled.term = std::move(term);

    state->banned.insert(compiled.term);
    state->terms.push_back(std::move(compiled));
  }

  return state;
}

void SwearFilter::update_terms(std::span<const std::string> banned_terms) {
  auto next = build_state(banned_terms);
  const std::size_t count = next->terms.size();

  // Публикуем новый снапшот; проверки в других потоках дорабатывают со старым.
  // clear() после публикации сдвигает поколение кеша, и их вердикты отбрасываются
  std::atomic_store(&state_, std::move(next));
  cache_.clear();

  std::cerr << "[lexguard] Banned terms updated: " << count
            << " terms, cache cleared\n";
}

std::shared_ptr<const SwearFilter::TermState> SwearFilter::snapshot() const {
  return std::atomic_load(&state_);
}

std::vector<std::string> SwearFilter::banned_terms() const {
  auto state = snapshot();
  std::vector<std::string> out;
  out.reserve(state->terms.size());
  for (const auto &t : state->terms) {
    out.push_back(t.term);
  }
  return out;
}

// ===========================================================================
// Проверка
// ===========================================================================

bool SwearFilter::contains_banned_term(std::string_view message) const
    noexcept {
  try {
    if (auto cached = cache_.get(message)) {
      cache_hits_.fetch_add(1, std::memory_order_relaxed);
      return *cached;
    }
    cache_misses_.fetch_add(1, std::memory_order_relaxed);

    // Поколение читается до снапшота: clear() в update_terms идёт после
    // публикации нового списка
    const std::uint64_t generation = cache_.generation();
    auto state = snapshot();
    MatchResult result = run_pipeline(message, *state);
    record(result);

    // Вердикт по устаревшему списку слов в кеш не попадает
    cache_.put_if_current(message, result.matched, generation);

    if (options_.verbose) {
      std::cerr << "[lexguard] " << (result.matched ? "BLOCKED" : "ALLOWED")
                << " stage=" << to_string(result.stage);
      if (!result.term.empty()) {
        std::cerr << " term=" << result.term;
      }
      if (!result.token.empty()) {
        std::cerr << " token=" << result.token;
      }
      std::cerr << "\n";
    }

    return result.matched;
  } catch (const std::exception &e) {
    std::cerr << "[lexguard] Check failed: " << e.what() << "\n";
    return false;
  }
}

MatchResult SwearFilter::inspect(std::string_view message) const {
  return run_pipeline(message, *snapshot());
}

void SwearFilter::record(const MatchResult &result) const noexcept {
  pipeline_runs_.fetch_add(1, std::memory_order_relaxed);
  stage_hits_[static_cast<std::size_t>(result.stage)].fetch_add(
      1, std::memory_order_relaxed);
}

bool SwearFilter::matches_root(std::u32string_view token,
                               const CompiledTerm &term) const {
  if (term.length == 0 || token.size() < term.length) {
    return false;
  }

  for (std::size_t i = 0; i + term.length <= token.size(); ++i) {
    const std::size_t suffix = token.size() - (i + term.length);
    if (suffix > options_.max_suffix_len) {
      continue;
    }
    const std::string window = encode_utf8(token.substr(i, term.length));
    if (expander_.can_produce(window, term.term, options_.segment_cap)) {
      return true;
    }
  }
  return false;
}

bool SwearFilter::is_short_form(std::string_view token) const {
  const auto &table = short_forms();
  if (token.size() <= options_.short_form_max_len && table.contains(token)) {
    return true;
  }

  // Повторная проверка без leetspeak символов
  std::string stripped;
  for (char c : token) {
    if (kShortFormStripChars.find(c) == std::string_view::npos) {
      stripped += c;
    }
  }
  return !stripped.empty() && stripped.size() <= options_.short_form_max_len &&
         table.contains(stripped);
}

MatchResult SwearFilter::run_pipeline(std::string_view message,
                                      const TermState &state) const {
  MatchResult result;

  if (message.empty() || state.terms.empty()) {
    return result;
  }

  auto finish = [&](bool matched, MatchStage stage, std::string term,
                    std::string token) {
    result.matched = matched;
    result.stage = stage;
    result.term = std::move(term);
    result.token = std::move(token);
    return result;
  };

  // Перебор вариантов сырых токенов (до нормализации)
  for (const auto &raw : split_whitespace(message)) {
    for (const auto &t : state.terms) {
      if (expander_.can_produce(raw, t.term, options_.raw_token_cap)) {
        return finish(true, MatchStage::RawExpansion, t.term, raw);
      }
    }
  }

  const std::string normalized = preprocess(message, *tables_);
  const std::vector<std::string> tokens = tokenize(normalized);

  // Безопасное слово разрешает всё сообщение
  for (const auto &tok : tokens) {
    if (safe_words_.contains(tok) && !state.banned.contains(tok)) {
      return finish(false, MatchStage::SafeWord, {}, tok);
    }
  }

  for (const auto &tok : tokens) {
    if (state.banned.contains(tok) && !whitelist_->is_whitelisted(message, tok)) {
      return finish(true, MatchStage::Direct, tok, tok);
    }
  }

  for (const auto &tok : tokens) {
    const std::u32string cps = decode_utf8(tok);
    for (const auto &t : state.terms) {
      if (t.length < options_.root_min_term_len) {
        continue;
      }
      if (matches_root(cps, t) && !whitelist_->is_whitelisted(message, t.term)) {
        return finish(true, MatchStage::RootSuffix, t.term, tok);
      }
    }
  }

  if (tokens.size() == 1 && tokens.front().size() <= options_.short_form_max_len &&
      is_short_form(tokens.front())) {
    return finish(true, MatchStage::ShortForm, {}, tokens.front());
  }

  if (options_.phonetic_enabled) {
    const std::string key = phonetic_.key(normalized);
    for (const auto &t : state.terms) {
      if (t.phonetic_key.empty() || key.find(t.phonetic_key) == std::string::npos) {
        continue;
      }
      if (!whitelist_->is_whitelisted(message, t.term)) {
        return finish(true, MatchStage::Phonetic, t.term, key);
      }
    }
  }

  return result;
}

// ===========================================================================
// Вспомогательные API
// ===========================================================================

std::vector<std::pair<std::string, bool>>
SwearFilter::test_batch(std::span<const std::string> messages) const {
  std::vector<std::pair<std::string, bool>> out;
  std::unordered_set<std::string_view> seen;
  out.reserve(messages.size());

  for (const auto &message : messages) {
    if (!seen.insert(message).second) {
      continue;
    }
    out.emplace_back(message, contains_banned_term(message));
  }
  return out;
}

std::vector<std::string>
SwearFilter::matched_terms(std::string_view message) const {
  std::vector<std::string> out;
  const auto state = snapshot();
  const icu::UnicodeString input = to_icu(message);

  for (const auto &t : state->terms) {
    if (!t.pattern) {
      continue;
    }
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexMatcher> matcher{t.pattern->matcher(input, status)};
    if (U_FAILURE(status)) {
      std::cerr << "[lexguard] Matcher for '" << t.term
                << "' failed: " << u_errorName(status) << "\n";
      continue;
    }
    const bool found = matcher->find(status);
    if (U_SUCCESS(status) && found) {
      out.push_back(t.term);
    }
  }
  return out;
}

std::vector<NormalizationStep>
SwearFilter::explain_normalization(std::string_view text) const {
  std::vector<NormalizationStep> steps;
  std::size_t position = 0;

  for (char32_t cp : decode_utf8(text)) {
    std::string glyph;
    append_utf8(glyph, cp);

    auto canonical = tables_->canonical_of(glyph);
    if (canonical && glyph != std::string(1, *canonical)) {
      steps.push_back(NormalizationStep{position, glyph, *canonical,
                                        format_code_point(cp)});
    }
    ++position;
  }
  return steps;
}

FilterStats SwearFilter::stats() const noexcept {
  FilterStats s;
  s.cache_hits = cache_hits_.load(std::memory_order_relaxed);
  s.cache_misses = cache_misses_.load(std::memory_order_relaxed);
  s.pipeline_runs = pipeline_runs_.load(std::memory_order_relaxed);
  for (std::size_t i = 0; i < kStageCount; ++i) {
    s.stage_hits[i] = stage_hits_[i].load(std::memory_order_relaxed);
  }
  return s;
}

} // namespace lexguard

/**
 * @file swear_filter.hpp
 * @brief Фильтр запрещённых слов, устойчивый к маскировке
 *
 * Находит запрещённое слово в сообщении, даже если оно замаскировано
 * гомоглифами, leetspeak, невидимыми разделителями, повторами букв,
 * пробелами между буквами или фонетическим написанием. Ложные срабатывания
 * на обычных словах ("classic", "assassin") гасятся безопасными словами и
 * контекстным белым списком.
 *
 * Стадии (первая сработавшая завершает проверку):
 *  1. кеш вердиктов;
 *  2. перебор вариантов «сырых» токенов;
 *  3. нормализация (preprocess) и разбиение на слова;
 *  4. безопасное слово -> сообщение разрешено целиком;
 *  5. прямое совпадение слова;
 *  6. корень + суффикс не длиннее max_suffix_len;
 *  7. сокращение из одного слова (wtf, fk);
 *  8. фонетический ключ.
 * Стадии 5, 6 и 8 отменяются контекстным белым списком.
 *
 * Все неизменяемые данные (таблицы, слова, паттерны) общие для потоков;
 * кеш и счётчики синхронизированы, поэтому один экземпляр можно вызывать
 * из нескольких потоков одновременно.
 */

#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include <unicode/regex.h>

#include "lexguard/context_whitelist.hpp"
#include "lexguard/glyph_tables.hpp"
#include "lexguard/phonetic.hpp"
#include "lexguard/result_cache.hpp"
#include "lexguard/types.hpp"
#include "lexguard/variant_expander.hpp"

namespace lexguard {

/// Число значений MatchStage
inline constexpr std::size_t kStageCount = 7;

/// Подробный результат проверки одного сообщения
struct MatchResult {
  bool matched = false;
  MatchStage stage = MatchStage::None;

  /// Запрещённое слово (пусто для SafeWord и ShortForm)
  std::string term;

  /// Токен сообщения, на котором принято решение
  std::string token;
};

/// Одна замена глифа (для диагностики нормализации)
struct NormalizationStep {
  std::size_t position; // Индекс кодовой точки
  std::string glyph;
  char canonical;
  std::string code_point; // U+XXXX
};

/// Счётчики contains_banned_term (inspect не учитывается)
struct FilterStats {
  std::uint64_t cache_hits = 0;
  std::uint64_t cache_misses = 0;
  std::uint64_t pipeline_runs = 0;

  /// Решения по стадиям, индекс: static_cast<size_t>(MatchStage)
  std::array<std::uint64_t, kStageCount> stage_hits{};
};

class SwearFilter {
public:
  /**
   * @brief Создаёт фильтр
   *
   * @param banned_terms Запрещённые слова (нормализуются: нижний регистр,
   *        trim, без повторов)
   * @param options Настройки конвейера
   * @param safe_words Безопасные слова; std::nullopt: встроенный список
   * @param whitelist Контекстный белый список; nullptr: встроенные правила
   * @param tables Таблицы глифов
   *
   * Конструктор не бросает из-за данных: паттерн, который не компилируется,
   * заменяется буквальным поиском слова.
   */
  explicit SwearFilter(
      std::span<const std::string> banned_terms, FilterOptions options = {},
      std::optional<std::vector<std::string>> safe_words = std::nullopt,
      std::shared_ptr<const ContextWhitelist> whitelist = nullptr,
      std::shared_ptr<const GlyphTables> tables = GlyphTables::shared());

  SwearFilter(const SwearFilter &) = delete;
  SwearFilter &operator=(const SwearFilter &) = delete;

  /**
   * @brief Главная проверка
   * @param message Сообщение (UTF-8), в том числе пустое
   * @return true если найдено запрещённое слово
   *
   * Никогда не бросает: внутренняя ошибка логируется, ответ: false.
   */
  [[nodiscard]] bool contains_banned_term(std::string_view message) const
      noexcept;

  /**
   * @brief Полный прогон конвейера без кеша
   *
   * Показывает стадию и слово, на которых принято решение.
   * В статистику не попадает.
   */
  [[nodiscard]] MatchResult inspect(std::string_view message) const;

  /**
   * @brief Проверяет пачку сообщений
   * @return Пары (сообщение, вердикт) в порядке первого появления;
   *         повторы схлопываются
   */
  [[nodiscard]] std::vector<std::pair<std::string, bool>>
  test_batch(std::span<const std::string> messages) const;

  /**
   * @brief Запрещённые слова, чей паттерн маскировки найден в сообщении
   *
   * Паттерн слова: для каждой буквы: альтернатива всех её двойников,
   * между буквами допускается [\W_]*. Используется для аудита.
   */
  [[nodiscard]] std::vector<std::string>
  matched_terms(std::string_view message) const;

  /// Глифы текста, которые нормализуются в другой символ
  [[nodiscard]] std::vector<NormalizationStep>
  explain_normalization(std::string_view text) const;

  /**
   * @brief Заменяет список запрещённых слов
   *
   * Перестраивает паттерны и фонетические ключи, полностью очищает кеш.
   */
  void update_terms(std::span<const std::string> banned_terms);

  [[nodiscard]] std::vector<std::string> banned_terms() const;

  [[nodiscard]] FilterStats stats() const noexcept;

  [[nodiscard]] std::size_t cache_size() const { return cache_.size(); }

  [[nodiscard]] const FilterOptions &options() const noexcept {
    return options_;
  }

private:
  /// Запрещённое слово со всем, что для него предвычислено
  struct CompiledTerm {
    std::string term;
    std::size_t length = 0; // В кодовых точках
    std::unique_ptr<icu::RegexPattern> pattern;
    std::string phonetic_key;
  };

  /// Неизменяемый снимок списка слов
  struct TermState {
    std::vector<CompiledTerm> terms;
    std::unordered_set<std::string> banned;
  };

  [[nodiscard]] std::shared_ptr<const TermState>
  build_state(std::span<const std::string> banned_terms) const;
  [[nodiscard]] std::unique_ptr<icu::RegexPattern>
  compile_term_pattern(const std::string &term) const;
  [[nodiscard]] std::shared_ptr<const TermState> snapshot() const;

  [[nodiscard]] MatchResult run_pipeline(std::string_view message,
                                         const TermState &state) const;
  [[nodiscard]] bool matches_root(std::u32string_view token,
                                  const CompiledTerm &term) const;
  [[nodiscard]] bool is_short_form(std::string_view token) const;
  void record(const MatchResult &result) const noexcept;

  FilterOptions options_;
  std::shared_ptr<const GlyphTables> tables_;
  std::shared_ptr<const ContextWhitelist> whitelist_;
  VariantExpander expander_;
  PhoneticFolder phonetic_;

  /// Безопасные слова в нормализованном виде
  std::unordered_set<std::string> safe_words_;

  /// Текущий список слов; заменяется целиком через std::atomic_store
  std::shared_ptr<const TermState> state_;

  mutable ResultCache<bool> cache_;

  mutable std::atomic<std::uint64_t> cache_hits_{0};
  mutable std::atomic<std::uint64_t> cache_misses_{0};
  mutable std::atomic<std::uint64_t> pipeline_runs_{0};
  mutable std::array<std::atomic<std::uint64_t>, kStageCount> stage_hits_{};
};

} // namespace lexguard

/**
 * @file glyph_tables.hpp
 * @brief Неизменяемые таблицы нормализации глифов
 *
 * Строятся один раз из сырых данных (substitution_data.hpp) и разделяются
 * между всеми экземплярами фильтра через std::shared_ptr<const GlyphTables>.
 * После построения ни одна таблица не изменяется, поэтому чтение из
 * нескольких потоков безопасно без блокировок.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "lexguard/substitution_data.hpp"

namespace lexguard {

/// Базовый символ и его отсортированные уникальные двойники
struct SubstitutionEntry {
  char canonical;
  std::vector<std::string> variants;
};

/**
 * @brief Таблицы подмен, нормализации и гомоглифов
 *
 * - substitutions: базовый символ -> варианты, без дубликатов, отсортированы
 *   по (длина в кодовых точках, лексикографически по кодовым точкам);
 * - normalization map: глиф -> базовый символ в нижнем регистре, при
 *   конфликте побеждает первая регистрация в порядке таблицы;
 * - reverse map: однокодовый глиф -> отсортированное множество базовых
 *   символов;
 * - homoglyphs: кодовая точка -> латинская буква.
 */
class GlyphTables {
public:
  /**
   * @brief Строит таблицы из сырых данных
   *
   * Некорректные записи (пустой или не-ASCII базовый символ, пустой список
   * вариантов) пропускаются с сообщением в лог, построение не прерывается.
   */
  GlyphTables(std::span<const RawSubstitution> substitutions,
              std::span<const RawHomoglyph> homoglyphs,
              std::span<const char32_t> hidden);

  /// Таблицы из встроенных данных, построенные один раз на процесс
  [[nodiscard]] static std::shared_ptr<const GlyphTables> shared();

  [[nodiscard]] const std::vector<SubstitutionEntry> &
  substitutions() const noexcept {
    return substitutions_;
  }

  /**
   * @brief Варианты для базового символа
   * @return Пустой span, если символ не зарегистрирован
   */
  [[nodiscard]] std::span<const std::string> variants_of(char canonical) const;

  /// Базовый символ для глифа (точное совпадение строки)
  [[nodiscard]] std::optional<char> canonical_of(std::string_view glyph) const;

  /// Длина самого длинного глифа в normalization map (в байтах)
  [[nodiscard]] std::size_t max_glyph_bytes() const noexcept {
    return max_glyph_bytes_;
  }

  [[nodiscard]] std::size_t normalization_size() const noexcept {
    return normalization_.size();
  }

  /**
   * @brief Базовые символы, которые может изображать кодовая точка
   * @return Отсортированный span; пустой, если кодовая точка не
   *         зарегистрирована
   */
  [[nodiscard]] std::span<const char32_t> reverse_of(char32_t cp) const;

  [[nodiscard]] std::optional<char> homoglyph_of(char32_t cp) const;

  [[nodiscard]] bool is_hidden_separator(char32_t cp) const {
    return hidden_.contains(cp);
  }

private:
  void add_substitution(const RawSubstitution &raw);
  void register_glyph(const std::string &glyph, char canonical);

  std::vector<SubstitutionEntry> substitutions_;
  std::unordered_map<char, std::size_t> substitution_index_;
  std::unordered_map<std::string, char> normalization_;
  std::unordered_map<char32_t, std::vector<char32_t>> reverse_;
  std::unordered_map<char32_t, char> homoglyphs_;
  std::unordered_set<char32_t> hidden_;
  std::size_t max_glyph_bytes_ = 0;
};

} // namespace lexguard

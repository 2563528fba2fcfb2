/**
 * @file phonetic.hpp
 * @brief Грубый фонетический ключ для последней стадии фильтра
 *
 * Ключ строится так:
 *  - глифы приводятся к базовым символам (normalize_to_base);
 *  - упрощённые правила metaphone: немые буквы, диграфы (ph -> f,
 *    ck -> k, th -> t ...), схлопывание соседних одинаковых букв;
 *  - для ключа длиной от 4 символов середина сортируется, первая и
 *    последняя буквы остаются на месте;
 *  - результат обрезается до max_len символов.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "lexguard/glyph_tables.hpp"
#include "lexguard/types.hpp"

namespace lexguard {

class PhoneticFolder {
public:
  explicit PhoneticFolder(
      std::shared_ptr<const GlyphTables> tables = GlyphTables::shared(),
      std::size_t max_len = kPhoneticKeyLen);

  /**
   * @brief Заменяет глифы на базовые символы
   *
   * Текст приводится к нижнему регистру, затем за один проход слева
   * направо каждый самый длинный известный глиф заменяется своим базовым
   * символом. Остальные символы сохраняются.
   */
  [[nodiscard]] std::string normalize_to_base(std::string_view text) const;

  /// Фонетический ключ строки (может быть пустым)
  [[nodiscard]] std::string key(std::string_view text) const;

  [[nodiscard]] std::size_t max_len() const noexcept { return max_len_; }

private:
  std::shared_ptr<const GlyphTables> tables_;
  std::size_t max_len_;
};

} // namespace lexguard

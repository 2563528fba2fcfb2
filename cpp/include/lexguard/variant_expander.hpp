/**
 * @file variant_expander.hpp
 * @brief Ограниченный перебор вариантов написания токена
 *
 * Каждая кодовая точка токена заменяется множеством базовых символов,
 * которые она может изображать (reverse map). Варианты перечисляются в
 * порядке одометра: последняя позиция меняется быстрее всех, варианты в
 * позиции отсортированы по возрастанию. Перебор останавливается после
 * `cap` строк: результат best-effort, а не полный.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "lexguard/glyph_tables.hpp"

namespace lexguard {

class VariantExpander {
public:
  explicit VariantExpander(
      std::shared_ptr<const GlyphTables> tables = GlyphTables::shared());

  /**
   * @brief Материализует варианты токена
   * @param token UTF-8 токен
   * @param cap Максимальное число вариантов
   * @return Не более cap различных строк в порядке перебора
   */
  [[nodiscard]] std::vector<std::string> expand(std::string_view token,
                                                std::size_t cap) const;

  /**
   * @brief Проверяет, что target входит в expand(token, cap)
   *
   * Не строит множество: вычисляет номер target в порядке одометра
   * (смешанная система счисления) и сравнивает его с cap. Номер считается
   * с насыщением, поэтому длинные токены не переполняют счётчик.
   */
  [[nodiscard]] bool can_produce(std::string_view token,
                                 std::string_view target,
                                 std::size_t cap) const;

  /// Варианты одной позиции (отсортированы; для незарегистрированной
  /// кодовой точки это она сама)
  [[nodiscard]] std::vector<char32_t> options_for(char32_t cp) const;

  [[nodiscard]] const GlyphTables &tables() const noexcept { return *tables_; }

private:
  std::shared_ptr<const GlyphTables> tables_;
};

} // namespace lexguard

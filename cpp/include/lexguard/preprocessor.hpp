/**
 * @file preprocessor.hpp
 * @brief Детерминированная очистка текста перед сопоставлением
 *
 * Конвейер в фиксированном порядке:
 *  1. удаление невидимых разделителей;
 *  2. NFKC;
 *  3. замена гомоглифов;
 *  4. схлопывание повторов (`heeellooo` -> `helo`);
 *  5. склейка одиночных букв через пробел (`f u c k` -> `fuck`);
 *  6. удаление всего, кроме ASCII букв, цифр и пробелов;
 *  7. нижний регистр и trim.
 *
 * Шаги 5-7 могут породить новые повторы и новые одиночные буквы, поэтому
 * preprocess() повторяет конвейер до неподвижной точки. После первого прохода
 * каждый следующий проход только укорачивает текст, так что цикл конечен.
 *
 * Все функции чистые и тотальные: пустой вход даёт пустой выход.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "lexguard/glyph_tables.hpp"

namespace lexguard {

// ===========================================================================
// Отдельные шаги
// ===========================================================================

[[nodiscard]] std::string remove_hidden_separators(std::string_view text,
                                                   const GlyphTables &tables);

/// Нормализация NFKC (ICU); при ошибке ICU текст возвращается как есть
[[nodiscard]] std::string nfkc_normalize(std::string_view text);

[[nodiscard]] std::string fold_homoglyphs(std::string_view text,
                                          const GlyphTables &tables);

/// Сводит каждую серию одинаковых кодовых точек к одной
[[nodiscard]] std::string squash_repeats(std::string_view text);

/// Склеивает две и более одиночные буквы, разделённые пробелами
[[nodiscard]] std::string collapse_spaced_letters(std::string_view text);

/// Оставляет только ASCII буквы, цифры и пробельные символы
[[nodiscard]] std::string strip_non_alnum(std::string_view text);

// ===========================================================================
// Конвейер
// ===========================================================================

/// Один проход всех семи шагов
[[nodiscard]] std::string preprocess_once(std::string_view text,
                                          const GlyphTables &tables);

/**
 * @brief Полная нормализация (идемпотентна)
 * @param text Исходное сообщение (UTF-8)
 * @param tables Таблицы глифов
 * @return Нормализованный текст: [a-z0-9] и пробелы
 */
[[nodiscard]] std::string preprocess(std::string_view text,
                                     const GlyphTables &tables);

/// То же с общими встроенными таблицами
[[nodiscard]] std::string preprocess(std::string_view text);

/**
 * @brief Выделяет слова из нормализованного текста
 *
 * Слово: максимальная последовательность [A-Za-z0-9_'].
 */
[[nodiscard]] std::vector<std::string> tokenize(std::string_view normalized);

} // namespace lexguard

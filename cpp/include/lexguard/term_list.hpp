/**
 * @file term_list.hpp
 * @brief Загрузка и нормализация списков слов
 *
 * Запрещённые слова приводятся к нижнему регистру, обрезаются и
 * дедуплицируются. Безопасные слова читаются из встроенного списка и
 * (опционально) из словаря: plain text по слову на строку или hunspell
 * .dic (первая строка: количество слов, суффикс "/flags" отбрасывается).
 */

#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lexguard {

/**
 * @brief Нормализует запрещённые слова
 *
 * Нижний регистр (Unicode), trim, удаление пустых и повторов с сохранением
 * порядка первого появления.
 */
[[nodiscard]] std::vector<std::string>
normalize_terms(std::span<const std::string> terms);

/**
 * @brief Делит ввод на слова по запятым и пробелам
 *
 * "word1, word2 word3" -> {"word1", "word2", "word3"}. Приводит к нижнему
 * регистру, выбрасывает всё, кроме [a-z0-9], запятых и пробелов, убирает
 * повторы.
 */
[[nodiscard]] std::vector<std::string> split_words(std::string_view input);

/**
 * @brief Читает файл запрещённых слов
 *
 * Пустые строки и строки, начинающиеся с '#', пропускаются; каждая строка
 * разбирается через split_words.
 *
 * @return std::nullopt если файл не удалось открыть
 */
[[nodiscard]] std::optional<std::vector<std::string>>
load_term_file(const std::filesystem::path &path);

/**
 * @brief Является ли слово запрещённым или его коротким продолжением
 *
 * Продолжение: начинается с запрещённого слова и длиннее не более чем на 3
 * символа ("fucker" для "fuck").
 */
[[nodiscard]] bool is_banned_variant(std::string_view word,
                                     std::span<const std::string> banned);

/// Встроенные безопасные слова
[[nodiscard]] std::vector<std::string> builtin_safe_words_list();

/**
 * @brief Встроенные безопасные слова + слова из словаря
 *
 * Слова словаря, совпадающие с запрещёнными или являющиеся их короткими
 * продолжениями, не добавляются. Если словарь не читается, возвращаются
 * только встроенные слова (с предупреждением в лог).
 */
[[nodiscard]] std::vector<std::string>
load_safe_words(const std::filesystem::path &path,
                std::span<const std::string> banned);

} // namespace lexguard

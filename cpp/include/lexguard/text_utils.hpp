/**
 * @file text_utils.hpp
 * @brief Утилиты для работы с UTF-8 текстом
 *
 * Декодирование/кодирование кодовых точек, регистр и пробелы по правилам
 * Unicode (через ICU), разбиение на «сырые» токены.
 */

#pragma once

#include <unicode/unistr.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace lexguard {

// ===========================================================================
// UTF-8
// ===========================================================================

/// Кодовая точка-заменитель для битых последовательностей
inline constexpr char32_t kReplacementChar = U'\uFFFD';

/**
 * @brief Определяет длину UTF-8 символа по первому байту
 * @param first_byte Первый байт UTF-8 последовательности
 * @return Длина в байтах (1-4), или 0 для невалидного байта
 */
[[nodiscard]] constexpr std::size_t
utf8_char_len(unsigned char first_byte) noexcept {
  if ((first_byte & 0x80) == 0)
    return 1; // ASCII
  if ((first_byte & 0xE0) == 0xC0)
    return 2; // 110xxxxx
  if ((first_byte & 0xF0) == 0xE0)
    return 3; // 1110xxxx
  if ((first_byte & 0xF8) == 0xF0)
    return 4; // 11110xxx
  return 0;   // Invalid
}

/**
 * @brief Декодирует UTF-8 строку в кодовые точки
 * @param text UTF-8 строка
 * @return Кодовые точки; битые последовательности заменяются на U+FFFD
 */
[[nodiscard]] std::u32string decode_utf8(std::string_view text);

/// Дописывает кодовую точку в UTF-8 строку
void append_utf8(std::string &out, char32_t cp);

/// Кодирует кодовые точки обратно в UTF-8
[[nodiscard]] std::string encode_utf8(std::u32string_view cps);

/// Количество кодовых точек в UTF-8 строке
[[nodiscard]] std::size_t code_point_count(std::string_view text);

// ===========================================================================
// Мост к ICU
// ===========================================================================

[[nodiscard]] icu::UnicodeString to_icu(std::string_view text);
[[nodiscard]] std::string from_icu(const icu::UnicodeString &text);

// ===========================================================================
// Регистр и пробелы
// ===========================================================================

/**
 * @brief Переводит строку в нижний регистр (полное отображение Unicode)
 *
 * Использует корневую локаль ICU, поэтому результат не зависит от
 * системной локали.
 */
[[nodiscard]] std::string to_lower(std::string_view text);

/// Переводит строку в верхний регистр (полное отображение Unicode)
[[nodiscard]] std::string to_upper(std::string_view text);

/// Пробельный символ по Unicode (White_Space)
[[nodiscard]] bool is_unicode_space(char32_t cp) noexcept;

/// Удаляет пробельные символы Unicode с начала и конца строки
[[nodiscard]] std::string trim(std::string_view text);

/**
 * @brief Разбивает текст на максимальные последовательности непробельных
 *        кодовых точек
 *
 * Невидимые разделители (U+200B и т.п.) пробелами не являются и остаются
 * внутри токена.
 */
[[nodiscard]] std::vector<std::string> split_whitespace(std::string_view text);

/// Форматирует кодовую точку как U+XXXX
[[nodiscard]] std::string format_code_point(char32_t cp);

} // namespace lexguard

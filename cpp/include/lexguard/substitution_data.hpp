/**
 * @file substitution_data.hpp
 * @brief Статические таблицы подмен символов
 *
 * Сырые данные для построения GlyphTables и фильтра: глифы-двойники для
 * каждой базовой буквы/цифры, гомоглифы, невидимые разделители, встроенные
 * безопасные слова, сокращения и правила контекстного белого списка.
 *
 * Порядок таблицы подмен фиксирован (a..z, A..Z, 0..9) и определяет, какая
 * базовая буква побеждает для неоднозначного глифа.
 */

#pragma once

#include <span>
#include <string_view>

namespace lexguard {

/// Базовый символ и список глифов, которые его имитируют
struct RawSubstitution {
  std::string_view canonical;
  std::span<const std::string_view> variants;
};

/// Гомоглиф из другой письменности -> латинская буква
struct RawHomoglyph {
  char32_t glyph;
  char latin;
};

/// Правило белого списка: слово и упорядоченные регулярные выражения
struct RawWhitelistRule {
  std::string_view term;
  std::span<const std::string_view> patterns;
};

[[nodiscard]] std::span<const RawSubstitution> raw_substitutions() noexcept;
[[nodiscard]] std::span<const RawHomoglyph> raw_homoglyphs() noexcept;
[[nodiscard]] std::span<const char32_t> hidden_separators() noexcept;

/// Встроенные безопасные слова (топонимы, медицинские термины и т.п.)
[[nodiscard]] std::span<const std::string_view> builtin_safe_words() noexcept;

/// Известные сокращения ругательств длиной до 3 символов
[[nodiscard]] std::span<const std::string_view> short_form_terms() noexcept;

/// Символы, которые удаляются при повторной проверке сокращений
inline constexpr std::string_view kShortFormStripChars = "1378245609@#$+*";

[[nodiscard]] std::span<const RawWhitelistRule>
builtin_whitelist_rules() noexcept;

} // namespace lexguard

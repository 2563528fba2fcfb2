/**
 * @file types.hpp
 * @brief Базовые типы и константы lexguard
 *
 * Фундаментальные типы, используемые во всём фильтре: лимиты перебора,
 * пути к конфигу, стадии конвейера и опции фильтра.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace lexguard {

// ===========================================================================
// Константы
// ===========================================================================

/// Максимальное число записей в кеше вердиктов
inline constexpr std::size_t kDefaultCacheSize = 1000;

/// Лимит перебора вариантов для «сырого» токена (до препроцессинга)
inline constexpr std::size_t kRawExpansionCap = 50000;

/// Лимит перебора вариантов для окна внутри токена (корень + суффикс)
inline constexpr std::size_t kSegmentExpansionCap = 10000;

/// Минимальная длина запрещённого слова для поиска «корень + суффикс»
inline constexpr std::size_t kRootMinTermLen = 3;

/// Максимальная длина хвоста после корня
inline constexpr std::size_t kMaxSuffixLen = 3;

/// Максимальная длина сокращения (wtf, fk, sht)
inline constexpr std::size_t kShortFormMaxLen = 3;

/// Длина фонетического ключа
inline constexpr std::size_t kPhoneticKeyLen = 8;

/// Бюджет времени на проверку контекстного белого списка одного слова
inline constexpr std::chrono::milliseconds kWhitelistTimeout{1000};

/// Путь к системному конфигурационному файлу
inline constexpr std::string_view kConfigPath = "/etc/lexguard/config.yaml";

/// Путь к пользовательскому конфигу (относительно $HOME)
inline constexpr std::string_view kUserConfigRelPath =
    ".config/lexguard/config.yaml";

// ===========================================================================
// Результаты операций
// ===========================================================================

/// Результат загрузки конфигурации
enum class ConfigResult { Ok, FileNotFound, ParseError, InvalidValue };

/// Стадия конвейера, на которой принято решение
enum class MatchStage : std::uint8_t {
  None,         // Ничего не найдено
  RawExpansion, // Перебор вариантов сырого токена
  SafeWord,     // Сообщение помиловано безопасным словом
  Direct,       // Прямое совпадение нормализованного токена
  RootSuffix,   // Корень + короткий суффикс
  ShortForm,    // Сокращение из одного токена
  Phonetic      // Фонетический ключ
};

/// Человекочитаемое имя стадии (для логов и CLI)
[[nodiscard]] constexpr std::string_view to_string(MatchStage stage) noexcept {
  switch (stage) {
  case MatchStage::None:
    return "none";
  case MatchStage::RawExpansion:
    return "raw-expansion";
  case MatchStage::SafeWord:
    return "safe-word";
  case MatchStage::Direct:
    return "direct";
  case MatchStage::RootSuffix:
    return "root-suffix";
  case MatchStage::ShortForm:
    return "short-form";
  case MatchStage::Phonetic:
    return "phonetic";
  }
  return "unknown";
}

// ===========================================================================
// Опции фильтра
// ===========================================================================

/// Настройки конвейера сопоставления
struct FilterOptions {
  /// Ёмкость кеша вердиктов
  std::size_t cache_size = kDefaultCacheSize;

  /// Лимит вариантов для сырого токена
  std::size_t raw_token_cap = kRawExpansionCap;

  /// Лимит вариантов для окна «корня»
  std::size_t segment_cap = kSegmentExpansionCap;

  std::size_t root_min_term_len = kRootMinTermLen;
  std::size_t max_suffix_len = kMaxSuffixLen;
  std::size_t short_form_max_len = kShortFormMaxLen;

  /// Включён ли фонетический фолбэк
  bool phonetic_enabled = true;

  /// Максимальная длина фонетического ключа
  std::size_t phonetic_key_len = kPhoneticKeyLen;

  /// Бюджет времени для контекстного белого списка
  std::chrono::milliseconds whitelist_timeout = kWhitelistTimeout;

  /// Логировать решение по каждому сообщению
  bool verbose = false;
};

} // namespace lexguard

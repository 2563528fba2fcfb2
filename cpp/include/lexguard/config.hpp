/**
 * @file config.hpp
 * @brief Конфигурация lexguard
 *
 * Типобезопасная конфигурация с YAML парсингом (подмножество: секции,
 * пары key: value, комментарии '#'). Все значения имеют разумные дефолты.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "lexguard/types.hpp"

namespace lexguard {

// ===========================================================================
// Структура конфигурации
// ===========================================================================

/// Пути к спискам слов
struct ListsConfig {
  /// Файл запрещённых слов (пустой путь: слова только из командной строки)
  std::filesystem::path banned_terms;

  /// Словарь безопасных слов (пустой путь: только встроенный список)
  std::filesystem::path safe_words;
};

/// Полная конфигурация приложения
struct Config {
  FilterOptions filter;
  ListsConfig lists;
  std::filesystem::path config_path{std::string{kConfigPath}};
};

// ===========================================================================
// Загрузчик конфигурации
// ===========================================================================

/// Результат загрузки конфигурации из файла.
///
/// В отличие от `load_config()`, это API НЕ делает скрытых фолбэков и
/// позволяет вызывающему коду принять решение (fail-fast / fallback).
struct ConfigLoadOutcome {
  Config config;
  ConfigResult result = ConfigResult::Ok;
  std::filesystem::path used_path;
  std::string error;
};

/**
 * @brief Загружает конфигурацию из конкретного файла
 *
 * @param path Абсолютный или относительный путь к конфигу
 * @return ConfigLoadOutcome с кодом результата и сообщением ошибки
 *
 * Некорректное значение ключа (не число, не bool) даёт ParseError,
 * значение вне допустимых пределов: InvalidValue.
 */
[[nodiscard]] ConfigLoadOutcome load_config_checked(std::filesystem::path path);

/**
 * @brief Загружает конфигурацию из YAML файла (best-effort)
 *
 * @param path Путь к конфигурационному файлу
 * @return Config с загруженными или дефолтными значениями
 *
 * Best-effort поведение: при ошибках чтения/валидации возвращает дефолты.
 * Если запрошен системный путь, сначала пробует ~/.config/lexguard/.
 */
[[nodiscard]] Config load_config(std::string_view path = kConfigPath);

/**
 * @brief Парсит бюджет времени из строки
 *
 * @param value Строка с числом (миллисекунды)
 * @return Положительное значение или std::nullopt
 */
[[nodiscard]] std::optional<std::chrono::milliseconds>
parse_timeout_ms(std::string_view value);

/**
 * @brief Валидирует конфигурацию
 *
 * @param config Конфигурация для проверки
 * @return true если все значения в допустимых пределах
 */
[[nodiscard]] bool validate_config(const Config &config);

} // namespace lexguard

/**
 * @file context_whitelist.hpp
 * @brief Контекстный белый список: отмена срабатывания по окружению слова
 *
 * Для запрещённого слова хранится упорядоченный список регулярных выражений
 * (ICU, без учёта регистра). Если хотя бы одно находится в исходном
 * сообщении, срабатывание отменяется ("classic" содержит "ass").
 *
 * Проверка ограничена по времени: после каждого паттерна сравнивается
 * прошедшее время с бюджетом правила, а каждому матчеру ICU выдаётся
 * остаток бюджета (RegexMatcher::setTimeLimit).
 */

#pragma once

#include <chrono>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <unicode/regex.h>

#include "lexguard/substitution_data.hpp"
#include "lexguard/types.hpp"

namespace lexguard {

/// Правило белого списка в исходном (некомпилированном) виде
struct WhitelistRule {
  std::string term;
  std::vector<std::string> patterns;
  std::chrono::milliseconds timeout = kWhitelistTimeout;
};

class ContextWhitelist {
public:
  /// Встроенные правила (cunt, ass, cock, hell)
  explicit ContextWhitelist(
      std::chrono::milliseconds timeout = kWhitelistTimeout);

  /**
   * @brief Правила вызывающей стороны
   *
   * Паттерны, которые не компилируются, пропускаются с сообщением в лог.
   */
  explicit ContextWhitelist(std::span<const WhitelistRule> rules);

  ContextWhitelist(const ContextWhitelist &) = delete;
  ContextWhitelist &operator=(const ContextWhitelist &) = delete;

  /**
   * @brief Проверяет, оправдано ли слово контекстом сообщения
   * @param message Исходное (необработанное) сообщение
   * @param term Запрещённое слово
   * @return true при первом совпавшем паттерне; false если правил нет,
   *         ничего не совпало или бюджет времени исчерпан
   */
  [[nodiscard]] bool is_whitelisted(std::string_view message,
                                    std::string_view term) const;

  [[nodiscard]] bool has_rules(std::string_view term) const;

  [[nodiscard]] std::size_t rule_count() const noexcept {
    return rules_.size();
  }

  /// Преобразует встроенную таблицу в правила с заданным бюджетом
  [[nodiscard]] static std::vector<WhitelistRule>
  builtin_rules(std::chrono::milliseconds timeout = kWhitelistTimeout);

private:
  struct CompiledRules {
    std::vector<std::unique_ptr<icu::RegexPattern>> patterns;
    std::chrono::milliseconds timeout;
  };

  void add_rule(const WhitelistRule &rule);

  std::unordered_map<std::string, CompiledRules> rules_;
};

} // namespace lexguard

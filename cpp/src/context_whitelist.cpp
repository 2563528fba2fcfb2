/**
 * @file context_whitelist.cpp
 * @brief Реализация контекстного белого списка
 */

#include "lexguard/context_whitelist.hpp"
#include "lexguard/text_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>

namespace lexguard {

ContextWhitelist::ContextWhitelist(std::chrono::milliseconds timeout) {
  for (const auto &rule : builtin_rules(timeout)) {
    add_rule(rule);
  }
}

ContextWhitelist::ContextWhitelist(std::span<const WhitelistRule> rules) {
  for (const auto &rule : rules) {
    add_rule(rule);
  }
}

std::vector<WhitelistRule>
ContextWhitelist::builtin_rules(std::chrono::milliseconds timeout) {
  std::vector<WhitelistRule> out;
  for (const auto &raw : builtin_whitelist_rules()) {
    WhitelistRule rule;
    rule.term = std::string{raw.term};
    for (std::string_view p : raw.patterns) {
      rule.patterns.emplace_back(p);
    }
    rule.timeout = timeout;
    out.push_back(std::move(rule));
  }
  return out;
}

void ContextWhitelist::add_rule(const WhitelistRule &rule) {
  if (rule.term.empty()) {
    return;
  }

  auto &compiled = rules_[rule.term];
  compiled.timeout = rule.timeout;

  for (const auto &pattern : rule.patterns) {
    UErrorCode status = U_ZERO_ERROR;
    UParseError parse_error{};
    std::unique_ptr<icu::RegexPattern> p{icu::RegexPattern::compile(
        to_icu(pattern), UREGEX_CASE_INSENSITIVE, parse_error, status)};
    if (U_FAILURE(status)) {
      std::cerr << "[lexguard] Skipping whitelist pattern for '" << rule.term
                << "' (" << pattern << "): " << u_errorName(status) << "\n";
      continue;
    }
    compiled.patterns.push_back(std::move(p));
  }
}

bool ContextWhitelist::has_rules(std::string_view term) const {
  return rules_.contains(std::string{term});
}

bool ContextWhitelist::is_whitelisted(std::string_view message,
                                      std::string_view term) const {
  auto it = rules_.find(std::string{term});
  if (it == rules_.end()) {
    return false;
  }

  const auto &compiled = it->second;
  const icu::UnicodeString input = to_icu(message);
  const auto started = std::chrono::steady_clock::now();

  for (const auto &pattern : compiled.patterns) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    const auto remaining = compiled.timeout - elapsed;
    if (remaining.count() <= 0) {
      break;
    }

    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexMatcher> matcher{
        pattern->matcher(input, status)};
    if (U_FAILURE(status)) {
      std::cerr << "[lexguard] Whitelist matcher failed for '" << term
                << "': " << u_errorName(status) << "\n";
      continue;
    }

    const auto limit_ms = std::min<long long>(
        remaining.count(), std::numeric_limits<int32_t>::max());
    matcher->setTimeLimit(static_cast<int32_t>(limit_ms), status);
    const bool found = matcher->find(status);

    if (status == U_REGEX_TIME_OUT) {
      std::cerr << "[lexguard] Whitelist check for '" << term
                << "' timed out\n";
      return false;
    }
    if (U_FAILURE(status)) {
      std::cerr << "[lexguard] Whitelist scan failed for '" << term
                << "': " << u_errorName(status) << "\n";
      continue;
    }
    if (found) {
      return true;
    }

    if (std::chrono::steady_clock::now() - started > compiled.timeout) {
      break;
    }
  }

  return false;
}

} // namespace lexguard

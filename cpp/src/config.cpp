/**
 * @file config.cpp
 * @brief Реализация загрузчика конфигурации
 */

#include "lexguard/config.hpp"

#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace lexguard {

namespace {

/// Верхняя граница лимитов перебора (защита от опечаток в конфиге)
constexpr long long kMaxExpansionCap = 10'000'000;

/// Верхняя граница бюджета белого списка (ICU принимает int32_t)
constexpr std::chrono::milliseconds kMaxWhitelistTimeout{60'000};

/// Удаляет пробелы с начала и конца строки
std::string_view trim_ascii(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

/// Снимает кавычки вокруг значения ("path" или 'path')
std::string_view unquote(std::string_view sv) {
  if (sv.size() >= 2 && (sv.front() == '"' || sv.front() == '\'') &&
      sv.back() == sv.front()) {
    return sv.substr(1, sv.size() - 2);
  }
  return sv;
}

/// Парсит целое число из строки
std::optional<long long> parse_int(std::string_view sv) {
  sv = trim_ascii(sv);
  long long value = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (ec == std::errc{} && ptr == sv.data() + sv.size()) {
    return value;
  }
  return std::nullopt;
}

/// Парсит булево значение из строки
std::optional<bool> parse_bool(std::string_view sv) {
  sv = trim_ascii(sv);
  if (sv == "true" || sv == "yes" || sv == "1" || sv == "on") {
    return true;
  }
  if (sv == "false" || sv == "no" || sv == "0" || sv == "off") {
    return false;
  }
  return std::nullopt;
}

/// Парсит неотрицательный размер
std::optional<std::size_t> parse_size(std::string_view sv) {
  auto v = parse_int(sv);
  if (!v || *v < 0) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(*v);
}

/// Получает путь к user config (~/.config/lexguard/config.yaml)
std::string get_user_config_path() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::string(home) + "/" + std::string(kUserConfigRelPath);
  }
  return "";
}

/// Результат разбора потока: конфиг + первая ошибка значения
struct ParsedConfig {
  Config config;
  std::string error;
};

ParsedConfig parse_config_stream(std::istream &file) {
  ParsedConfig parsed;
  Config &config = parsed.config;

  std::string line;
  std::string current_section;
  std::size_t line_no = 0;

  auto bad_value = [&](std::string_view key, std::string_view value) {
    if (parsed.error.empty()) {
      parsed.error = "Invalid value for " + current_section + "." +
                     std::string{key} + " at line " + std::to_string(line_no) +
                     ": '" + std::string{value} + "'";
    }
  };

  auto set_size = [&](std::string_view key, std::string_view value,
                      std::size_t &target) {
    if (auto v = parse_size(value)) {
      target = *v;
    } else {
      bad_value(key, value);
    }
  };

  auto set_bool = [&](std::string_view key, std::string_view value,
                      bool &target) {
    if (auto v = parse_bool(value)) {
      target = *v;
    } else {
      bad_value(key, value);
    }
  };

  while (std::getline(file, line)) {
    ++line_no;
    std::string_view sv = trim_ascii(line);

    // Пропуск пустых строк и комментариев
    if (sv.empty() || sv.front() == '#') {
      continue;
    }

    // Определение секции: строка без отступа вида "name:"
    const bool indented =
        !line.empty() && std::isspace(static_cast<unsigned char>(line[0]));
    if (!indented && sv.back() == ':') {
      current_section = std::string{trim_ascii(sv.substr(0, sv.size() - 1))};
      continue;
    }

    // Парсинг key: value
    auto colon_pos = sv.find(':');
    if (colon_pos == std::string_view::npos) {
      continue;
    }

    std::string_view key = trim_ascii(sv.substr(0, colon_pos));
    std::string_view value = trim_ascii(sv.substr(colon_pos + 1));

    // Комментарий в конце строки
    if (auto hash = value.find(" #"); hash != std::string_view::npos) {
      value = trim_ascii(value.substr(0, hash));
    }

    if (current_section == "cache") {
      if (key == "max_entries") {
        set_size(key, value, config.filter.cache_size);
      }
    } else if (current_section == "expansion") {
      if (key == "raw_token_cap") {
        set_size(key, value, config.filter.raw_token_cap);
      } else if (key == "segment_cap") {
        set_size(key, value, config.filter.segment_cap);
      }
    } else if (current_section == "matching") {
      if (key == "root_min_term_len") {
        set_size(key, value, config.filter.root_min_term_len);
      } else if (key == "max_suffix_len") {
        set_size(key, value, config.filter.max_suffix_len);
      } else if (key == "short_form_max_len") {
        set_size(key, value, config.filter.short_form_max_len);
      } else if (key == "phonetic_enabled") {
        set_bool(key, value, config.filter.phonetic_enabled);
      } else if (key == "phonetic_key_len") {
        set_size(key, value, config.filter.phonetic_key_len);
      }
    } else if (current_section == "whitelist") {
      if (key == "timeout_ms") {
        if (auto t = parse_timeout_ms(value)) {
          config.filter.whitelist_timeout = *t;
        } else {
          bad_value(key, value);
        }
      }
    } else if (current_section == "lists") {
      if (key == "banned_terms") {
        config.lists.banned_terms = std::string{unquote(value)};
      } else if (key == "safe_words") {
        config.lists.safe_words = std::string{unquote(value)};
      }
    } else if (current_section == "logging") {
      if (key == "verbose") {
        set_bool(key, value, config.filter.verbose);
      }
    }
  }

  return parsed;
}

} // namespace

std::optional<std::chrono::milliseconds>
parse_timeout_ms(std::string_view value) {
  auto ms = parse_int(value);
  if (ms && *ms > 0) {
    return std::chrono::milliseconds{*ms};
  }
  return std::nullopt;
}

bool validate_config(const Config &config) {
  const auto &f = config.filter;

  // Проверка лимитов перебора
  if (f.raw_token_cap == 0 || f.segment_cap == 0 ||
      f.raw_token_cap > static_cast<std::size_t>(kMaxExpansionCap) ||
      f.segment_cap > static_cast<std::size_t>(kMaxExpansionCap)) {
    return false;
  }

  if (f.cache_size == 0) {
    return false;
  }

  if (f.whitelist_timeout.count() <= 0 ||
      f.whitelist_timeout > kMaxWhitelistTimeout) {
    return false;
  }

  if (f.phonetic_key_len == 0 || f.root_min_term_len == 0) {
    return false;
  }

  return true;
}

ConfigLoadOutcome load_config_checked(std::filesystem::path path) {
  ConfigLoadOutcome out;
  out.used_path = std::move(path);

  if (out.used_path.empty()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Empty config path";
    return out;
  }

  std::ifstream file{out.used_path};
  if (!file.is_open()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Config file not found: " + out.used_path.string();
    return out;
  }

  ParsedConfig parsed = parse_config_stream(file);
  if (!parsed.error.empty()) {
    out.result = ConfigResult::ParseError;
    out.error = parsed.error + " in " + out.used_path.string();
    return out;
  }

  out.config = std::move(parsed.config);
  out.config.config_path = out.used_path;

  if (!validate_config(out.config)) {
    out.result = ConfigResult::InvalidValue;
    out.error = "Invalid configuration in: " + out.used_path.string();
    out.config = Config{};
    return out;
  }

  out.result = ConfigResult::Ok;
  return out;
}

Config load_config(std::string_view path) {
  // Best-effort логика: если запрошен дефолтный путь, пробуем user-config
  // первым.
  std::filesystem::path effective_path{std::string{path}};

  if (path == kConfigPath) {
    std::string user_path = get_user_config_path();
    if (!user_path.empty()) {
      std::error_code ec;
      bool exists = std::filesystem::exists(user_path, ec);
      if (!ec && exists) {
        effective_path = user_path;
        std::cerr << "[lexguard] Using user config: " << user_path << "\n";
      }
    }
  }

  ConfigLoadOutcome out = load_config_checked(effective_path);
  if (out.result != ConfigResult::Ok) {
    // Файл не найден/битый: используем дефолты.
    if (!out.error.empty()) {
      std::cerr << "[lexguard] Warning: " << out.error << "\n";
    }
    return Config{};
  }

  return out.config;
}

} // namespace lexguard

/**
 * @file main.cpp
 * @brief Точка входа lexguard
 *
 * Проверяет сообщения на запрещённые слова и печатает вердикт.
 *
 * Запуск: lexguard -t banned.txt "message one" "message two"
 *         tail -f chat.log | lexguard -c /etc/lexguard/config.yaml
 */

#include "lexguard/config.hpp"
#include "lexguard/swear_filter.hpp"
#include "lexguard/term_list.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <signal.h>
#include <string>
#include <string_view>
#include <vector>

namespace {

volatile sig_atomic_t g_running = 1;

void signal_handler(int sig) {
  if (sig == SIGINT || sig == SIGTERM) {
    g_running = 0;
  }
}

constexpr int kExitUsage = 2;

void print_version() {
  std::cout << "lexguard 1.0.0 (C++20)\n"
            << "Фильтр запрещённых слов, устойчивый к маскировке\n";
}

void print_usage(const char *argv0) {
  std::cout << "Использование: " << argv0 << " [опции] [сообщение...]\n"
            << "\n"
            << "Опции:\n"
            << "  -h, --help            Показать эту справку\n"
            << "  -v, --version         Показать версию\n"
            << "  -c, --config PATH     Конфигурационный файл\n"
            << "  -t, --terms PATH      Файл запрещённых слов\n"
            << "  -w, --words LIST      Запрещённые слова через запятую\n"
            << "  -s, --safe-words PATH Словарь безопасных слов\n"
            << "  -e, --explain         Показать стадию и замены глифов\n"
            << "      --verbose         Логировать каждое решение\n"
            << "\n"
            << "Без сообщений в аргументах читает по одному сообщению на "
               "строку из stdin.\n"
            << "\n"
            << "Конфигурация: /etc/lexguard/config.yaml\n";
}

struct CliOptions {
  std::optional<std::string> config_path;
  std::optional<std::string> terms_path;
  std::optional<std::string> safe_words_path;
  std::vector<std::string> inline_terms;
  std::vector<std::string> messages;
  bool explain = false;
  bool verbose = false;
};

void report(const lexguard::SwearFilter &filter, const std::string &message,
            bool explain) {
  const bool blocked = filter.contains_banned_term(message);
  std::cout << (blocked ? "BLOCKED" : "ALLOWED") << "\t" << message << "\n";

  if (!explain) {
    return;
  }

  const lexguard::MatchResult result = filter.inspect(message);
  std::cout << "  stage: " << lexguard::to_string(result.stage);
  if (!result.term.empty()) {
    std::cout << " (term: " << result.term << ")";
  }
  if (!result.token.empty()) {
    std::cout << " (token: " << result.token << ")";
  }
  std::cout << "\n";

  for (const auto &term : filter.matched_terms(message)) {
    std::cout << "  pattern: " << term << "\n";
  }

  for (const auto &step : filter.explain_normalization(message)) {
    std::cout << "  #" << step.position << " " << step.glyph << " ("
              << step.code_point << ") -> " << step.canonical << "\n";
  }
}

} // namespace

int main(int argc, char *argv[]) {
  CliOptions cli;

  // Обработка аргументов командной строки
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    auto next_value = [&](std::string_view name) -> std::optional<std::string> {
      if (i + 1 >= argc) {
        std::cerr << "[lexguard] Missing value for " << name << "\n";
        return std::nullopt;
      }
      return std::string{argv[++i]};
    };

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      print_version();
      return 0;
    }
    if (arg == "-e" || arg == "--explain") {
      cli.explain = true;
    } else if (arg == "--verbose") {
      cli.verbose = true;
    } else if (arg == "-c" || arg == "--config") {
      cli.config_path = next_value(arg);
      if (!cli.config_path) {
        return kExitUsage;
      }
    } else if (arg == "-t" || arg == "--terms") {
      cli.terms_path = next_value(arg);
      if (!cli.terms_path) {
        return kExitUsage;
      }
    } else if (arg == "-s" || arg == "--safe-words") {
      cli.safe_words_path = next_value(arg);
      if (!cli.safe_words_path) {
        return kExitUsage;
      }
    } else if (arg == "-w" || arg == "--words") {
      auto list = next_value(arg);
      if (!list) {
        return kExitUsage;
      }
      for (auto &w : lexguard::split_words(*list)) {
        cli.inline_terms.push_back(std::move(w));
      }
    } else if (arg == "--") {
      for (++i; i < argc; ++i) {
        cli.messages.emplace_back(argv[i]);
      }
    } else if (arg.starts_with("-") && arg.size() > 1) {
      std::cerr << "[lexguard] Unknown option: " << arg << "\n";
      print_usage(argv[0]);
      return kExitUsage;
    } else {
      cli.messages.emplace_back(arg);
    }
  }

  // Загрузка конфигурации
  lexguard::Config config;
  if (cli.config_path) {
    auto outcome = lexguard::load_config_checked(*cli.config_path);
    if (outcome.result != lexguard::ConfigResult::Ok) {
      std::cerr << "[lexguard] " << outcome.error << "\n";
      return kExitUsage;
    }
    config = std::move(outcome.config);
  } else {
    config = lexguard::load_config();
  }
  if (cli.verbose) {
    config.filter.verbose = true;
  }

  // Запрещённые слова: файл из аргументов важнее файла из конфига
  std::vector<std::string> terms = cli.inline_terms;
  std::filesystem::path terms_path =
      cli.terms_path ? std::filesystem::path{*cli.terms_path}
                     : config.lists.banned_terms;
  if (!terms_path.empty()) {
    auto loaded = lexguard::load_term_file(terms_path);
    if (!loaded) {
      std::cerr << "[lexguard] Cannot read banned terms: " << terms_path
                << "\n";
      return kExitUsage;
    }
    std::cerr << "[lexguard] Loaded banned terms: " << terms_path << " ("
              << loaded->size() << " terms)\n";
    terms.insert(terms.end(), loaded->begin(), loaded->end());
  }

  if (terms.empty()) {
    std::cerr << "[lexguard] No banned terms given (use -t or -w)\n";
    return kExitUsage;
  }

  std::optional<std::vector<std::string>> safe_words;
  std::filesystem::path safe_path = cli.safe_words_path
                                        ? std::filesystem::path{*cli.safe_words_path}
                                        : config.lists.safe_words;
  if (!safe_path.empty()) {
    safe_words = lexguard::load_safe_words(safe_path, terms);
  }

  // Установка обработчиков сигналов
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  lexguard::SwearFilter filter{terms, config.filter, std::move(safe_words)};

  if (!cli.messages.empty()) {
    for (const auto &message : cli.messages) {
      report(filter, message, cli.explain);
    }
    return 0;
  }

  std::string line;
  while (g_running && std::getline(std::cin, line)) {
    report(filter, line, cli.explain);
  }

  const auto stats = filter.stats();
  std::cerr << "[lexguard] Checked " << stats.cache_hits + stats.cache_misses
            << " messages (" << stats.cache_hits << " cached)\n";

  return 0;
}

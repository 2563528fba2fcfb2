/**
 * @file variant_expander.cpp
 * @brief Реализация перебора вариантов
 */

#include "lexguard/variant_expander.hpp"
#include "lexguard/text_utils.hpp"

#include <algorithm>

namespace lexguard {

VariantExpander::VariantExpander(std::shared_ptr<const GlyphTables> tables)
    : tables_(std::move(tables)) {}

std::vector<char32_t> VariantExpander::options_for(char32_t cp) const {
  auto reverse = tables_->reverse_of(cp);
  if (reverse.empty()) {
    return {cp};
  }
  return {reverse.begin(), reverse.end()};
}

std::vector<std::string> VariantExpander::expand(std::string_view token,
                                                 std::size_t cap) const {
  std::vector<std::string> result;
  if (cap == 0) {
    return result;
  }

  const std::u32string cps = decode_utf8(token);

  std::vector<std::vector<char32_t>> options;
  options.reserve(cps.size());
  for (char32_t cp : cps) {
    options.push_back(options_for(cp));
  }

  // Одометр: odometer[i]: индекс варианта в позиции i
  std::vector<std::size_t> odometer(options.size(), 0);
  std::u32string current;
  current.reserve(cps.size());

  while (result.size() < cap) {
    current.clear();
    for (std::size_t i = 0; i < options.size(); ++i) {
      current.push_back(options[i][odometer[i]]);
    }
    result.push_back(encode_utf8(current));

    // Инкремент с переносом, последняя позиция: младший разряд
    std::size_t pos = options.size();
    while (pos > 0) {
      --pos;
      if (++odometer[pos] < options[pos].size()) {
        break;
      }
      odometer[pos] = 0;
      if (pos == 0) {
        return result; // Все комбинации перебраны
      }
    }
    if (options.empty()) {
      break;
    }
  }

  return result;
}

bool VariantExpander::can_produce(std::string_view token,
                                  std::string_view target,
                                  std::size_t cap) const {
  if (cap == 0) {
    return false;
  }

  const std::u32string src = decode_utf8(token);
  const std::u32string dst = decode_utf8(target);
  if (src.size() != dst.size()) {
    return false;
  }

  // Номер в смешанной системе: rank = rank * radix + index, с насыщением
  std::size_t rank = 0;
  for (std::size_t i = 0; i < src.size(); ++i) {
    const std::vector<char32_t> options = options_for(src[i]);
    auto it = std::lower_bound(options.begin(), options.end(), dst[i]);
    if (it == options.end() || *it != dst[i]) {
      return false;
    }

    const auto index = static_cast<std::size_t>(it - options.begin());
    const std::size_t radix = options.size();
    if (rank >= cap || index >= cap || rank > (cap - index) / radix) {
      rank = cap;
    } else {
      rank = rank * radix + index;
    }
  }

  return rank < cap;
}

} // namespace lexguard

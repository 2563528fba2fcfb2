/**
 * @file glyph_tables.cpp
 * @brief Построение таблиц нормализации глифов
 */

#include "lexguard/glyph_tables.hpp"
#include "lexguard/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace lexguard {

namespace {

/// Порядок вариантов: сначала короткие, затем по кодовым точкам
bool variant_less(const std::string &a, const std::string &b) {
  const std::size_t la = code_point_count(a);
  const std::size_t lb = code_point_count(b);
  if (la != lb) {
    return la < lb;
  }
  // Байтовый порядок UTF-8 совпадает с порядком кодовых точек
  return a < b;
}

bool is_ascii_alnum(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 &&
         static_cast<unsigned char>(c) < 0x80;
}

} // namespace

GlyphTables::GlyphTables(std::span<const RawSubstitution> substitutions,
                         std::span<const RawHomoglyph> homoglyphs,
                         std::span<const char32_t> hidden) {
  for (const auto &raw : substitutions) {
    add_substitution(raw);
  }

  for (auto &entry : substitutions_) {
    std::sort(entry.variants.begin(), entry.variants.end(), variant_less);
    entry.variants.erase(
        std::unique(entry.variants.begin(), entry.variants.end()),
        entry.variants.end());
  }

  // Регистрация в порядке таблицы: первая базовая буква побеждает
  for (const auto &entry : substitutions_) {
    const char base = static_cast<char>(
        std::tolower(static_cast<unsigned char>(entry.canonical)));
    for (const auto &variant : entry.variants) {
      register_glyph(variant, base);
      register_glyph(to_lower(variant), base);
      register_glyph(to_upper(variant), base);
    }
  }

  for (auto &[cp, bases] : reverse_) {
    std::sort(bases.begin(), bases.end());
    bases.erase(std::unique(bases.begin(), bases.end()), bases.end());
  }

  for (const auto &h : homoglyphs) {
    if (h.glyph == 0 || !is_ascii_alnum(h.latin)) {
      std::cerr << "[lexguard] Skipping invalid homoglyph "
                << format_code_point(h.glyph) << "\n";
      continue;
    }
    homoglyphs_.emplace(h.glyph, h.latin);
  }

  hidden_.insert(hidden.begin(), hidden.end());
}

std::shared_ptr<const GlyphTables> GlyphTables::shared() {
  static const std::shared_ptr<const GlyphTables> tables =
      std::make_shared<GlyphTables>(raw_substitutions(), raw_homoglyphs(),
                                    hidden_separators());
  return tables;
}

void GlyphTables::add_substitution(const RawSubstitution &raw) {
  if (raw.canonical.size() != 1 || !is_ascii_alnum(raw.canonical.front())) {
    std::cerr << "[lexguard] Skipping substitution entry with invalid base '"
              << raw.canonical << "'\n";
    return;
  }

  const char canonical = raw.canonical.front();

  std::vector<std::string> variants;
  variants.reserve(raw.variants.size());
  for (std::string_view v : raw.variants) {
    if (v.empty()) {
      continue;
    }
    variants.emplace_back(v);
  }

  if (variants.empty()) {
    std::cerr << "[lexguard] Skipping substitution entry '" << canonical
              << "': no variants\n";
    return;
  }

  // Повторная запись для той же буквы дополняет существующую
  auto it = substitution_index_.find(canonical);
  if (it != substitution_index_.end()) {
    auto &existing = substitutions_[it->second].variants;
    existing.insert(existing.end(), variants.begin(), variants.end());
    return;
  }

  substitution_index_.emplace(canonical, substitutions_.size());
  substitutions_.push_back(SubstitutionEntry{canonical, std::move(variants)});
}

void GlyphTables::register_glyph(const std::string &glyph, char canonical) {
  if (glyph.empty()) {
    return;
  }

  if (normalization_.emplace(glyph, canonical).second) {
    max_glyph_bytes_ = std::max(max_glyph_bytes_, glyph.size());
  }

  // Для перебора вариантов годятся только однокодовые глифы
  const std::u32string cps = decode_utf8(glyph);
  if (cps.size() == 1) {
    reverse_[cps.front()].push_back(static_cast<char32_t>(canonical));
  }
}

std::span<const std::string> GlyphTables::variants_of(char canonical) const {
  auto it = substitution_index_.find(canonical);
  if (it == substitution_index_.end()) {
    return {};
  }
  return substitutions_[it->second].variants;
}

std::optional<char> GlyphTables::canonical_of(std::string_view glyph) const {
  auto it = normalization_.find(std::string{glyph});
  if (it == normalization_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::span<const char32_t> GlyphTables::reverse_of(char32_t cp) const {
  auto it = reverse_.find(cp);
  if (it == reverse_.end()) {
    return {};
  }
  return it->second;
}

std::optional<char> GlyphTables::homoglyph_of(char32_t cp) const {
  auto it = homoglyphs_.find(cp);
  if (it == homoglyphs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace lexguard

/**
 * @file result_cache.hpp
 * @brief Ограниченный потокобезопасный кеш вердиктов
 *
 * При переполнении вытесняется самая старая по вставке запись (не LRU:
 * чтение и обновление значения позицию не меняют).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace lexguard {

template <class V> class ResultCache {
public:
  explicit ResultCache(std::size_t max_entries) : max_entries_(max_entries) {}

  ResultCache(const ResultCache &) = delete;
  ResultCache &operator=(const ResultCache &) = delete;

  [[nodiscard]] std::optional<V> get(std::string_view key) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = map_.find(std::string{key});
    if (it == map_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void put(std::string_view key, V value) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    insert_locked(key, std::move(value));
  }

  /**
   * @brief Вставка, если с момента чтения generation() не было clear()
   *
   * Сравнение и вставка выполняются под одной блокировкой.
   * @return true если значение записано
   */
  bool put_if_current(std::string_view key, V value,
                      std::uint64_t generation) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    if (generation != generation_) {
      return false;
    }
    insert_locked(key, std::move(value));
    return true;
  }

  /// Очищает кеш и сдвигает поколение
  void clear() {
    std::unique_lock<std::shared_mutex> lock(mu_);
    map_.clear();
    order_.clear();
    ++generation_;
  }

  [[nodiscard]] std::uint64_t generation() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return generation_;
  }

  [[nodiscard]] std::size_t size() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return map_.size();
  }

  [[nodiscard]] std::size_t capacity() const noexcept { return max_entries_; }

private:
  void insert_locked(std::string_view key, V value) {
    if (max_entries_ == 0) {
      return;
    }

    std::string k{key};
    auto it = map_.find(k);
    if (it != map_.end()) {
      it->second = std::move(value);
      return;
    }

    while (map_.size() >= max_entries_ && !order_.empty()) {
      map_.erase(order_.front());
      order_.pop_front();
    }

    order_.push_back(k);
    map_.emplace(std::move(k), std::move(value));
  }

  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, V> map_;
  std::deque<std::string> order_;
  const std::size_t max_entries_;
  std::uint64_t generation_ = 0;
};

} // namespace lexguard

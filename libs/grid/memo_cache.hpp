#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

namespace grid {

struct cache_stats {
  size_t size = 0;
  size_t capacity = 0;
  size_t lookups = 0;
  double hit_rate = 0.;
};

/**
 * Bounded memoization table.
 *
 * Once capacity is reached new keys are computed but not stored, so the table
 * never grows past the size it was created with. Not synchronized: a cache
 * belongs to a single owner.
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class memo_cache {
public:
  static constexpr size_t default_capacity = 1000;

  explicit memo_cache(std::string_view name, size_t capacity = default_capacity)
      : name_{name}, capacity_{capacity} {
    entries_.reserve(capacity_);
  }

  std::optional<V> try_get(const K& key) {
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
      ++misses_;
      return std::nullopt;
    }
    ++hits_;
    return it->second;
  }

  void set(const K& key, V val) {
    if (entries_.size() >= capacity_ && !entries_.contains(key)) {
      if (!full_reported_) {
        spdlog::debug("{} cache reached its capacity of {} entries", name_, capacity_);
        full_reported_ = true;
      }
      return;
    }
    entries_.insert_or_assign(key, std::move(val));
  }

  template <typename F>
  V get_or_compute(const K& key, F&& compute) {
    if (auto cached = try_get(key))
      return *std::move(cached);
    V val = std::invoke(std::forward<F>(compute));
    set(key, val);
    return val;
  }

  void clear() noexcept {
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
    full_reported_ = false;
  }

  [[nodiscard]] cache_stats stats() const noexcept {
    const size_t lookups = hits_ + misses_;
    return {
        .size = entries_.size(),
        .capacity = capacity_,
        .lookups = lookups,
        .hit_rate = lookups == 0 ? 0. : static_cast<double>(hits_) / static_cast<double>(lookups)
    };
  }

  [[nodiscard]] std::string_view name() const noexcept { return name_; }

private:
  std::string_view name_;
  size_t capacity_;
  std::unordered_map<K, V, Hash> entries_;
  size_t hits_ = 0;
  size_t misses_ = 0;
  bool full_reported_ = false;
};

} // namespace grid

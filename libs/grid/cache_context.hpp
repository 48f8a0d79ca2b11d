#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include <libs/grid/memo_cache.hpp>

namespace grid {

struct pair_hash {
  template <typename A, typename B>
  size_t operator()(const std::pair<A, B>& p) const noexcept {
    const size_t h1 = std::hash<A>{}(p.first);
    const size_t h2 = std::hash<B>{}(p.second);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15 + (h1 << 6) + (h1 >> 2));
  }
};

/**
 * Memoization state for one grid. Algorithms opt in by taking the context as
 * an explicit argument; results are identical to the uncached overloads.
 */
template <typename Coord, typename Neighbors>
struct cache_context {
  explicit cache_context(size_t capacity = memo_cache<Coord, Neighbors>::default_capacity)
      : neighbors{"neighbors", capacity}, distances{"distance", capacity}, ranges{"range", capacity} {}

  memo_cache<Coord, Neighbors> neighbors;
  memo_cache<std::pair<Coord, Coord>, int, pair_hash> distances;
  memo_cache<std::pair<Coord, int>, std::vector<Coord>, pair_hash> ranges;

  void clear() noexcept {
    neighbors.clear();
    distances.clear();
    ranges.clear();
    spdlog::debug("grid caches cleared: {}, {}, {}", neighbors.name(), distances.name(), ranges.name());
  }

  [[nodiscard]] cache_stats stats() const noexcept {
    cache_stats res;
    double hits = 0.;
    for (const cache_stats& part : {neighbors.stats(), distances.stats(), ranges.stats()}) {
      res.size += part.size;
      res.capacity += part.capacity;
      res.lookups += part.lookups;
      hits += part.hit_rate * static_cast<double>(part.lookups);
    }
    res.hit_rate = res.lookups == 0 ? 0. : hits / static_cast<double>(res.lookups);
    return res;
  }

  /// Distance is symmetric so both argument orders share one entry.
  static std::pair<Coord, Coord> distance_key(Coord a, Coord b) noexcept {
    return b < a ? std::pair{b, a} : std::pair{a, b};
  }
};

} // namespace grid

#pragma once

namespace grid {

/**
 * Per-axis bounds a coordinate must stay within to be considered valid.
 * Guards region algorithms against runaway arithmetic; cells outside are
 * skipped, never clamped.
 */
struct limits {
  int min_value = -10000;
  int max_value = 10000;

  constexpr bool contains(int val) const noexcept { return val >= min_value && val <= max_value; }

  template <typename... I>
  constexpr bool contains_all(I... vals) const noexcept {
    return (contains(vals) && ...);
  }
};

inline constexpr limits default_limits{};

} // namespace grid

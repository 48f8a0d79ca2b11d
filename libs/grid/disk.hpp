#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>

#include <libs/grid/limits.hpp>

namespace grid {

/// Cells in a cube disk of the given radius: 3r^2 + 3r + 1, zero for negative radius.
constexpr uint64_t disk_size(int radius) noexcept {
  if (radius < 0)
    return 0;
  const uint64_t r = static_cast<uint64_t>(radius);
  return 3 * r * (r + 1) + 1;
}

/**
 * Calls `fn(x, y, z)` for every cube cell within `radius` of the center
 * (cx, cy, cz) whose three axes lie within `lim`. Axes are clamped before
 * iterating, so the cost is bounded by the limits rather than by the radius.
 * Returns the number of disk cells left out.
 */
template <typename F>
uint64_t for_each_in_disk(int cx, int cy, int cz, int radius, const limits& lim, F&& fn) {
  if (radius < 0)
    return 0;
  const int64_t r = radius;
  const int64_t lo = lim.min_value;
  const int64_t hi = lim.max_value;
  uint64_t visited = 0;
  for (int64_t dx = std::max(-r, lo - cx); dx <= std::min(r, hi - cx); ++dx) {
    const int64_t dy_first = std::max({-r, -dx - r, lo - cy, cz - dx - hi});
    const int64_t dy_last = std::min({r, -dx + r, hi - cy, cz - dx - lo});
    for (int64_t dy = dy_first; dy <= dy_last; ++dy) {
      fn(static_cast<int>(cx + dx), static_cast<int>(cy + dy), static_cast<int>(cz - dx - dy));
      ++visited;
    }
  }
  return disk_size(radius) - visited;
}

/// Capacity hint for a disk enumeration, never above the cube hexagon the limits allow.
constexpr size_t disk_reserve(int radius, const limits& lim) noexcept {
  if (lim.max_value < lim.min_value)
    return 0;
  const int64_t half = (int64_t{lim.max_value} - lim.min_value) / 2;
  const int bounded = static_cast<int>(std::min<int64_t>(radius, half));
  return static_cast<size_t>(disk_size(bounded));
}

} // namespace grid

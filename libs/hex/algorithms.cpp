#include <algorithm>
#include <cstdint>

#include <spdlog/spdlog.h>

#include <libs/grid/disk.hpp>
#include <libs/grid/rounding.hpp>
#include <libs/hex/algorithms.hpp>
#include <libs/hex/format.hpp>

namespace hex {

namespace {

void report_skipped(const char* region, cube center, int radius, uint64_t skipped) {
  if (skipped == 0)
    return;
  spdlog::debug("hex {} around {} with radius {} skipped {} cells outside of limits", region, center, radius, skipped);
}

} // namespace

std::vector<cube> range(cube center, int radius, const grid::limits& lim) {
  std::vector<cube> res;
  if (radius < 0)
    return res;
  res.reserve(grid::disk_reserve(radius, lim));
  uint64_t rejected = 0;
  const uint64_t clipped = grid::for_each_in_disk(center.x, center.y, center.z, radius, lim, [&](int x, int y, int z) {
    if (const cube cell{x, y, z}; is_valid(cell, lim))
      res.push_back(cell);
    else
      ++rejected;
  });
  report_skipped("range", center, radius, clipped + rejected);
  return res;
}

std::vector<cube> ring(cube center, int radius, const grid::limits& lim) {
  std::vector<cube> res;
  if (radius < 0)
    return res;
  if (radius == 0) {
    if (is_valid(center, lim))
      res.push_back(center);
    return res;
  }
  res.reserve(direction_count * radius);
  size_t skipped = 0;
  for (size_t side = 0; side < direction_count; ++side) {
    cube cell = add(center, scale(cube_directions[side], radius));
    for (int i = 0; i < radius; ++i) {
      if (is_valid(cell, lim))
        res.push_back(cell);
      else
        ++skipped;
      cell = step(cell, (side + 2) % direction_count);
    }
  }
  report_skipped("ring", center, radius, skipped);
  return res;
}

std::vector<cube> line(cube from, cube to) {
  const int n = distance(from, to);
  std::vector<cube> res;
  res.reserve(n + 1);
  res.push_back(from);
  for (int i = 1; i < n; ++i) {
    const float t = static_cast<float>(i) / static_cast<float>(n);
    res.push_back(as_cube(grid::cube_round(grid::cube_lerp(as_vec(from), as_vec(to), t))));
  }
  if (n > 0)
    res.push_back(to);
  return res;
}

grid::result<cube> reflect(cube c, int axis) noexcept {
  switch (axis) {
  case 0: return cube{c.x, c.z, c.y};
  case 1: return cube{c.z, c.y, c.x};
  case 2: return cube{c.y, c.x, c.z};
  }
  return std::unexpected(grid::errc::invalid_argument);
}

std::array<axial, direction_count> neighbors(axial a, cache_context& ctx) {
  return ctx.neighbors.get_or_compute(a, [a] { return neighbors(a); });
}

int distance(axial a, axial b, cache_context& ctx) {
  return ctx.distances.get_or_compute(cache_context::distance_key(a, b), [a, b] { return distance(a, b); });
}

std::vector<axial> range(axial center, int radius, cache_context& ctx) {
  return ctx.ranges.get_or_compute({center, radius}, [center, radius] { return range(center, radius); });
}

void warm_up(cache_context& ctx, axial center, int radius) {
  for (axial cell : range(center, radius, ctx))
    neighbors(cell, ctx);
  spdlog::debug("hex caches warmed up around {} with radius {}", center, radius);
}

} // namespace hex

#include <algorithm>
#include <cstdint>

#include <spdlog/spdlog.h>

#include <libs/grid/disk.hpp>
#include <libs/grid/rounding.hpp>
#include <libs/tri/algorithms.hpp>
#include <libs/tri/format.hpp>
#include <libs/tri/lattice.hpp>

namespace tri {

namespace {

void report_skipped(const char* region, cube center, int radius, uint64_t skipped) {
  if (skipped == 0)
    return;
  spdlog::debug("tri {} around {} with radius {} skipped {} cells outside of limits", region, center, radius, skipped);
}

} // namespace

std::vector<axial> vertex_neighbors(axial a, const grid::limits& lim) {
  std::vector<axial> res;
  res.reserve(4 * direction_count);
  auto push = [&](axial cell) {
    if (cell != a && is_valid(to_cube(cell), lim) && std::ranges::find(res, cell) == res.end())
      res.push_back(cell);
  };
  for (axial cell : neighbors(a))
    push(cell);
  for (triangular::point pt : corners(a)) {
    for (axial cell : cells_around(pt))
      push(cell);
  }
  return res;
}

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
  std::vector<cube> res = range(center, radius, lim);
  std::erase_if(res, [&](cube c) { return distance(c, center) != radius; });
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
  spdlog::debug("tri caches warmed up around {} with radius {}", center, radius);
}

} // namespace tri

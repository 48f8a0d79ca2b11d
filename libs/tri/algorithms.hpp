#pragma once

#include <algorithm>
#include <array>
#include <vector>

#include <glm/glm.hpp>

#include <libs/grid/cache_context.hpp>
#include <libs/grid/limits.hpp>
#include <libs/tri/coords.hpp>
#include <libs/tri/directions.hpp>

namespace tri {

using cache_context = grid::cache_context<axial, std::array<axial, direction_count>>;

constexpr glm::ivec3 as_vec(cube c) noexcept { return {c.x, c.y, c.z}; }
constexpr cube as_cube(glm::ivec3 v) noexcept { return {v.x, v.y, v.z}; }

template <coordinate_type A, coordinate_type B>
constexpr int distance(A a, B b) noexcept {
  const cube d = subtract(to_cube(a), to_cube(b));
  const auto magnitude = [](int v) { return v < 0 ? -v : v; };
  return std::max({magnitude(d.x), magnitude(d.y), magnitude(d.z)});
}

template <coordinate_type A, coordinate_type B>
constexpr bool in_range(A c, B center, int radius) noexcept {
  return radius >= 0 && distance(c, center) <= radius;
}

/**
 * Cells sharing at least one corner with `a`: the three edge neighbors
 * followed by the cells touching only a corner, twelve away from the limits.
 */
std::vector<axial> vertex_neighbors(axial a, const grid::limits& lim = grid::default_limits);

template <coordinate_type C>
std::vector<C> vertex_neighbors(C c, const grid::limits& lim = grid::default_limits) {
  const std::vector<axial> cells = vertex_neighbors(to_axial(c), lim);
  return convert_all<C, axial>(cells);
}

/// Cube disk of 3r^2 + 3r + 1 cells, empty for negative radius.
std::vector<cube> range(cube center, int radius, const grid::limits& lim = grid::default_limits);
/// Cells at exactly `radius` from center, 6r of them, in range enumeration order.
std::vector<cube> ring(cube center, int radius, const grid::limits& lim = grid::default_limits);
/// distance(from, to) + 1 cells, first and last are exactly from and to.
std::vector<cube> line(cube from, cube to);

template <coordinate_type C>
std::vector<C> range(C center, int radius, const grid::limits& lim = grid::default_limits) {
  const std::vector<cube> cells = range(to_cube(center), radius, lim);
  return convert_all<C, cube>(cells);
}

template <coordinate_type C>
std::vector<C> ring(C center, int radius, const grid::limits& lim = grid::default_limits) {
  const std::vector<cube> cells = ring(to_cube(center), radius, lim);
  return convert_all<C, cube>(cells);
}

template <coordinate_type C>
std::vector<C> line(C from, C to) {
  const std::vector<cube> cells = line(to_cube(from), to_cube(to));
  return convert_all<C, cube>(cells);
}

// memoized variants

std::array<axial, direction_count> neighbors(axial a, cache_context& ctx);
int distance(axial a, axial b, cache_context& ctx);
std::vector<axial> range(axial center, int radius, cache_context& ctx);

template <coordinate_type C>
std::array<C, direction_count> neighbors(C c, cache_context& ctx) {
  const std::array<axial, direction_count> cells = neighbors(to_axial(c), ctx);
  std::array<C, direction_count> res;
  std::ranges::transform(cells, res.begin(), [](axial a) { return convert<C>(a); });
  return res;
}

template <coordinate_type A, coordinate_type B>
int distance(A a, B b, cache_context& ctx) {
  return distance(to_axial(a), to_axial(b), ctx);
}

template <coordinate_type C>
std::vector<C> range(C center, int radius, cache_context& ctx) {
  const std::vector<axial> cells = range(to_axial(center), radius, ctx);
  return convert_all<C, axial>(cells);
}

void warm_up(cache_context& ctx, axial center, int radius);

} // namespace tri

#pragma once

#include <algorithm>
#include <array>
#include <span>
#include <vector>

#include <glm/glm.hpp>

#include <libs/grid/cache_context.hpp>
#include <libs/grid/errc.hpp>
#include <libs/grid/limits.hpp>
#include <libs/hex/coords.hpp>
#include <libs/hex/directions.hpp>

namespace hex {

using cache_context = grid::cache_context<axial, std::array<axial, direction_count>>;

constexpr glm::ivec3 as_vec(cube c) noexcept { return {c.x, c.y, c.z}; }
constexpr cube as_cube(glm::ivec3 v) noexcept { return {v.x, v.y, v.z}; }

// distance

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

// regions over cube coordinates

/// Filled disk of 3r^2 + 3r + 1 cells, empty for negative radius.
std::vector<cube> range(cube center, int radius, const grid::limits& lim = grid::default_limits);

/**
 * Cells at exactly `radius` steps from center, walked in direction table order
 * starting at center + radius * cube_directions[0]. Empty for negative radius,
 * [center] for zero.
 */
std::vector<cube> ring(cube center, int radius, const grid::limits& lim = grid::default_limits);

/// distance(from, to) + 1 cells, first and last are exactly from and to.
std::vector<cube> line(cube from, cube to);

// regions for every other representation, computed over cube

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

// transformations

/**
 * Rotation by steps * 60 degrees around the origin. One step moves
 * cube_directions[i] onto cube_directions[i - 1], any step count is accepted.
 */
constexpr cube rotate(cube c, int steps) noexcept {
  for (int i = 0; i < ((steps % 6) + 6) % 6; ++i)
    c = {-c.z, -c.x, -c.y};
  return c;
}

template <coordinate_type C>
constexpr C rotate_around(C c, C center, int steps) noexcept {
  const cube pivot = to_cube(center);
  return convert<C>(add(rotate(subtract(to_cube(c), pivot), steps), pivot));
}

/// Mirror keeping the given axis (0 = x, 1 = y, 2 = z) and swapping the other two.
grid::result<cube> reflect(cube c, int axis) noexcept;

// offset rectangles

template <offset_type O>
constexpr bool in_rectangle(O o, int min_col, int max_col, int min_row, int max_row) noexcept {
  return o.col >= min_col && o.col <= max_col && o.row >= min_row && o.row <= max_row;
}

/// Column major enumeration of an offset rectangle, bounds inclusive.
template <offset_type O>
grid::result<std::vector<O>> rectangle(
    int min_col, int max_col, int min_row, int max_row, const grid::limits& lim = grid::default_limits
) {
  if (min_col > max_col || min_row > max_row)
    return std::unexpected(grid::errc::invalid_argument);
  std::vector<O> res;
  for (int col = min_col; col <= max_col; ++col) {
    for (int row = min_row; row <= max_row; ++row) {
      if (const O cell{col, row}; is_valid(cell, lim))
        res.push_back(cell);
    }
  }
  return res;
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

/// Precomputes neighbors of every cell within radius and the range itself.
void warm_up(cache_context& ctx, axial center, int radius);

} // namespace hex

#pragma once

#include <array>
#include <cstddef>

#include <libs/geom/triangular_net.hpp>
#include <libs/tri/coords.hpp>

/**
 * Cells on the triangular lattice.
 *
 * Row r is the strip between lattice rows r and r + 1. Every lattice rhombus
 * (t..t+1, r..r+1) holds an upward cell q = 2t + r and a downward cell
 * q = 2t + r + 1:
 *
 *       (t,r+1) ______ (t+1,r+1)
 *              /\    /
 *             /  \ d/
 *            / u  \/
 *     (t,r) /_____/ (t+1,r)
 */
namespace tri {

inline constexpr size_t corner_count = 3;
/// Number of cells sharing one lattice point.
inline constexpr size_t cells_per_point = 6;

/// Lattice points of the cell corners, the horizontal edge comes first.
template <coordinate_type C>
std::array<triangular::point, corner_count> corners(C c) noexcept {
  const axial a = to_axial(c);
  if (is_upward(a)) {
    const int t = (a.q - a.r) / 2;
    return {triangular::point{t, a.r}, triangular::point{t + 1, a.r}, triangular::point{t, a.r + 1}};
  }
  const int t = (a.q - a.r - 1) / 2;
  return {triangular::point{t, a.r + 1}, triangular::point{t + 1, a.r + 1}, triangular::point{t + 1, a.r}};
}

/// Cells having `pt` as a corner: three above it and three below.
inline std::array<axial, cells_per_point> cells_around(triangular::point pt) noexcept {
  const int c = 2 * pt.x + pt.y;
  return {
      axial{c - 2, pt.y},     axial{c - 1, pt.y},     axial{c, pt.y},
      axial{c - 2, pt.y - 1}, axial{c - 1, pt.y - 1}, axial{c, pt.y - 1},
  };
}

} // namespace tri

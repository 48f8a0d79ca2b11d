#pragma once

#include <array>

#include <glm/glm.hpp>

#include <mp-units/systems/si.h>

#include <libs/grid/errc.hpp>
#include <libs/hex/coords.hpp>

namespace hex {

/**
 * Mapping between axial coordinates and the XY plane.
 *
 * `forward` turns (q, r) into a position for a unit radius cell, `inverse` is
 * its exact inverse. Corner i of a cell lies at angle 60deg * (start_angle + i).
 */
struct layout {
  glm::mat2 forward;
  glm::mat2 inverse;
  float start_angle;
};

/// Cells have a corner at the top, columns of cells are zig-zagged.
extern const layout pointy_top;
/// Cells have a flat edge at the top, rows of cells are zig-zagged.
extern const layout flat_top;

/// Distance from the cell center to any of its corners.
using cell_size_t = mp_units::quantity<mp_units::isq::radius[mp_units::si::metre], float>;
using world_length_t = mp_units::quantity<mp_units::isq::length[mp_units::si::metre], float>;

inline constexpr size_t corner_count = 6;

grid::result<glm::vec3> to_world(axial a, cell_size_t size, const layout& l = pointy_top);

template <coordinate_type C>
grid::result<glm::vec3> to_world(C c, cell_size_t size, const layout& l = pointy_top) {
  return to_world(to_axial(c), size, l);
}

cube cube_round(glm::vec3 frac) noexcept;
/// Rounds fractional (q, r) through the cube form.
axial axial_round(glm::vec2 frac) noexcept;

/// Cell containing a point of the XY plane, z is ignored.
grid::result<axial> cell_at(glm::vec3 pt, cell_size_t size, const layout& l = pointy_top);

template <coordinate_type C>
grid::result<C> from_world(glm::vec3 pt, cell_size_t size, const layout& l = pointy_top) {
  const grid::result<axial> cell = cell_at(pt, size, l);
  if (!cell)
    return std::unexpected(cell.error());
  return convert<C>(*cell);
}

grid::result<std::array<glm::vec3, corner_count>> corners(
    axial a, cell_size_t size, const layout& l = pointy_top
);

template <coordinate_type C>
grid::result<std::array<glm::vec3, corner_count>> corners(C c, cell_size_t size, const layout& l = pointy_top) {
  return corners(to_axial(c), size, l);
}

/// Euclidean distance between two cell centers.
grid::result<world_length_t> world_distance(axial a, axial b, cell_size_t size, const layout& l = pointy_top);

template <coordinate_type A, coordinate_type B>
grid::result<world_length_t> world_distance(A a, B b, cell_size_t size, const layout& l = pointy_top) {
  return world_distance(to_axial(a), to_axial(b), size, l);
}

} // namespace hex

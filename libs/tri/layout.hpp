#pragma once

#include <array>

#include <glm/glm.hpp>

#include <mp-units/systems/si.h>

#include <libs/grid/errc.hpp>
#include <libs/tri/coords.hpp>
#include <libs/tri/lattice.hpp>

namespace tri {

using edge_length_t = mp_units::quantity<mp_units::isq::length[mp_units::si::metre], float>;

/// Centroid of the cell on the XY plane.
grid::result<glm::vec3> to_world(axial a, edge_length_t edge);

template <coordinate_type C>
grid::result<glm::vec3> to_world(C c, edge_length_t edge) {
  return to_world(to_axial(c), edge);
}

/// Cell containing a point of the XY plane, z is ignored.
grid::result<axial> cell_at(glm::vec3 pt, edge_length_t edge);

template <coordinate_type C>
grid::result<C> from_world(glm::vec3 pt, edge_length_t edge) {
  const grid::result<axial> cell = cell_at(pt, edge);
  if (!cell)
    return std::unexpected(cell.error());
  return convert<C>(*cell);
}

/// World positions of the cell corners in the order of `corners`.
grid::result<std::array<glm::vec3, corner_count>> corner_positions(axial a, edge_length_t edge);

template <coordinate_type C>
grid::result<std::array<glm::vec3, corner_count>> corner_positions(C c, edge_length_t edge) {
  return corner_positions(to_axial(c), edge);
}

} // namespace tri

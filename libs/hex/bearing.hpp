#pragma once

#include <string_view>

#include <libs/hex/coords.hpp>
#include <libs/hex/layout.hpp>

namespace hex {

enum class compass { east, north_east, north, north_west, west, south_west, south, south_east };

/**
 * Angle of the vector between two cell centers in degrees, counted counter
 * clockwise from +x and normalized to [0, 360). Cell size does not affect
 * angles so it is not asked for. Equal cells give 0.
 */
float bearing_degrees(axial from, axial to, const layout& l = pointy_top) noexcept;

template <coordinate_type A, coordinate_type B>
float bearing_degrees(A from, B to, const layout& l = pointy_top) noexcept {
  return bearing_degrees(to_axial(from), to_axial(to), l);
}

/// Eight 45deg wide sectors centered on the compass directions. Accepts any angle.
compass compass_direction(float degrees) noexcept;

std::string_view to_string(compass dir) noexcept;

} // namespace hex

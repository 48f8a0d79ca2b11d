#pragma once

#include <glm/glm.hpp>

/**
 * Triangle coords system basis:
 *
 *     ty
 *    /       angle between basis vectors = M_PI/3
 *   /___tx   basis vector length = 1
 *
 * Lattice points are the corners of the triangular tiling: every unit rhombus
 * (tx..tx+1, ty..ty+1) is split into an upward and a downward triangle.
 */
namespace triangular {

using point = glm::ivec2;

extern const glm::mat2 to_cartesian_transformation;
extern const glm::mat2 from_cartesian_transformation;

inline glm::vec2 to_cartesian(point pt) noexcept { return to_cartesian_transformation * glm::vec2{pt}; }

/// Fractional lattice coordinates of an arbitrary cartesian point.
inline glm::vec2 from_cartesian(glm::vec2 pt) noexcept { return from_cartesian_transformation * pt; }

} // namespace triangular

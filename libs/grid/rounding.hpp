#pragma once

#include <cmath>

#include <glm/glm.hpp>

namespace grid {

/**
 * Rounds fractional cube coordinates to the nearest lattice cell keeping
 * x + y + z == 0.
 *
 * Every axis is rounded to nearest (ties to even) and the axis with the
 * largest rounding error is rebuilt from the other two. When errors are equal
 * the axis is picked in x, y, z order.
 */
inline glm::ivec3 cube_round(glm::vec3 frac) noexcept {
  glm::ivec3 res{
      static_cast<int>(std::lrint(frac.x)), static_cast<int>(std::lrint(frac.y)),
      static_cast<int>(std::lrint(frac.z))
  };
  const glm::vec3 diff = glm::abs(glm::vec3{res} - frac);

  if (diff.x >= diff.y && diff.x >= diff.z)
    res.x = -res.y - res.z;
  else if (diff.y >= diff.z)
    res.y = -res.x - res.z;
  else
    res.z = -res.x - res.y;
  return res;
}

inline glm::vec3 cube_lerp(glm::ivec3 from, glm::ivec3 to, float t) noexcept {
  return glm::vec3{from} + glm::vec3{to - from} * t;
}

} // namespace grid

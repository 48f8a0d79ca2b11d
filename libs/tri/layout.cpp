#include <algorithm>
#include <cmath>

#include <libs/tri/layout.hpp>

namespace tri {

namespace {

grid::result<float> metres(edge_length_t edge) noexcept {
  const float res = edge.numerical_value_in(mp_units::si::metre);
  if (!(res > 0.f))
    return std::unexpected(grid::errc::degenerate_input);
  return res;
}

} // namespace

grid::result<glm::vec3> to_world(axial a, edge_length_t edge) {
  const grid::result<float> len = metres(edge);
  if (!len)
    return std::unexpected(len.error());
  glm::vec2 sum{0.f};
  for (triangular::point pt : corners(a))
    sum += triangular::to_cartesian(pt);
  return glm::vec3{*len * sum / static_cast<float>(corner_count), 0.f};
}

grid::result<axial> cell_at(glm::vec3 pt, edge_length_t edge) {
  const grid::result<float> len = metres(edge);
  if (!len)
    return std::unexpected(len.error());
  const glm::vec2 lattice = triangular::from_cartesian(glm::vec2{pt} / *len);
  const glm::vec2 base = glm::floor(lattice);
  const glm::vec2 frac = lattice - base;
  const int t = static_cast<int>(base.x);
  const int r = static_cast<int>(base.y);
  return axial{2 * t + r + (frac.x + frac.y < 1.f ? 0 : 1), r};
}

grid::result<std::array<glm::vec3, corner_count>> corner_positions(axial a, edge_length_t edge) {
  const grid::result<float> len = metres(edge);
  if (!len)
    return std::unexpected(len.error());
  std::array<glm::vec3, corner_count> res;
  std::ranges::transform(corners(a), res.begin(), [s = *len](triangular::point pt) {
    return glm::vec3{s * triangular::to_cartesian(pt), 0.f};
  });
  return res;
}

} // namespace tri

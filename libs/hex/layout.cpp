#include <cmath>
#include <numbers>

#include <libs/grid/rounding.hpp>
#include <libs/hex/algorithms.hpp>
#include <libs/hex/layout.hpp>

namespace hex {

namespace {

constexpr float sqrt3 = std::numbers::sqrt3_v<float>;

grid::result<float> metres(cell_size_t size) noexcept {
  const float res = size.numerical_value_in(mp_units::si::metre);
  if (!(res > 0.f))
    return std::unexpected(grid::errc::degenerate_input);
  return res;
}

glm::vec2 center(axial a, float size, const layout& l) noexcept {
  return size * (l.forward * glm::vec2{a.q, a.r});
}

} // namespace

// glm matrices are filled column by column
const layout pointy_top{
    .forward = glm::mat2{sqrt3, 0.f, sqrt3 / 2.f, 3.f / 2.f},
    .inverse = glm::mat2{sqrt3 / 3.f, 0.f, -1.f / 3.f, 2.f / 3.f},
    .start_angle = 0.5f
};

const layout flat_top{
    .forward = glm::mat2{3.f / 2.f, sqrt3 / 2.f, 0.f, sqrt3},
    .inverse = glm::mat2{2.f / 3.f, -1.f / 3.f, 0.f, sqrt3 / 3.f},
    .start_angle = 0.f
};

grid::result<glm::vec3> to_world(axial a, cell_size_t size, const layout& l) {
  const grid::result<float> s = metres(size);
  if (!s)
    return std::unexpected(s.error());
  return glm::vec3{center(a, *s, l), 0.f};
}

cube cube_round(glm::vec3 frac) noexcept { return as_cube(grid::cube_round(frac)); }

axial axial_round(glm::vec2 frac) noexcept { return to_axial(cube_round({frac.x, -frac.x - frac.y, frac.y})); }

grid::result<axial> cell_at(glm::vec3 pt, cell_size_t size, const layout& l) {
  const grid::result<float> s = metres(size);
  if (!s)
    return std::unexpected(s.error());
  return axial_round(l.inverse * (glm::vec2{pt} / *s));
}

grid::result<std::array<glm::vec3, corner_count>> corners(axial a, cell_size_t size, const layout& l) {
  const grid::result<float> s = metres(size);
  if (!s)
    return std::unexpected(s.error());
  const glm::vec2 c = center(a, *s, l);
  std::array<glm::vec3, corner_count> res;
  for (size_t i = 0; i < corner_count; ++i) {
    const float angle = 2.f * std::numbers::pi_v<float> * (l.start_angle + static_cast<float>(i)) / corner_count;
    res[i] = glm::vec3{c + *s * glm::vec2{std::cos(angle), std::sin(angle)}, 0.f};
  }
  return res;
}

grid::result<world_length_t> world_distance(axial a, axial b, cell_size_t size, const layout& l) {
  const grid::result<float> s = metres(size);
  if (!s)
    return std::unexpected(s.error());
  return glm::distance(center(a, *s, l), center(b, *s, l)) * mp_units::si::metre;
}

} // namespace hex

#pragma once

#include <array>
#include <string>
#include <string_view>
#include <variant>

#include <glm/glm.hpp>

#include <libs/grid/errc.hpp>
#include <libs/grid/limits.hpp>
#include <libs/hex/coords.hpp>
#include <libs/hex/directions.hpp>
#include <libs/hex/layout.hpp>

namespace hex {

/// Any hexagon coordinate. Alternatives are listed in the order of `kind`.
using coordinate = std::variant<cube, axial, offset_odd_q, offset_even_q, doubled>;

enum class kind { cube, axial, odd_q, even_q, doubled };

kind kind_of(const coordinate& c) noexcept;

axial to_axial(const coordinate& c) noexcept;
cube to_cube(const coordinate& c) noexcept;
coordinate convert(const coordinate& c, kind to) noexcept;

bool is_valid(const coordinate& c, const grid::limits& lim = grid::default_limits) noexcept;
int distance(const coordinate& a, const coordinate& b) noexcept;

/// Neighbors are returned in the representation of `c`.
std::array<coordinate, direction_count> neighbors(const coordinate& c) noexcept;
grid::result<coordinate> neighbor(const coordinate& c, int dir) noexcept;

grid::result<glm::vec3> to_world(const coordinate& c, cell_size_t size, const layout& l = pointy_top);

std::string to_string(const coordinate& c);
std::string_view to_string(kind k) noexcept;

} // namespace hex

#pragma once

#include <array>
#include <string>
#include <string_view>
#include <variant>

#include <glm/glm.hpp>

#include <libs/grid/errc.hpp>
#include <libs/grid/limits.hpp>
#include <libs/tri/coords.hpp>
#include <libs/tri/directions.hpp>
#include <libs/tri/layout.hpp>

namespace tri {

using coordinate = std::variant<cube, axial, offset>;

enum class kind { cube, axial, offset };

kind kind_of(const coordinate& c) noexcept;

axial to_axial(const coordinate& c) noexcept;
cube to_cube(const coordinate& c) noexcept;
coordinate convert(const coordinate& c, kind to) noexcept;

orientation orientation_of(const coordinate& c) noexcept;
bool is_valid(const coordinate& c, const grid::limits& lim = grid::default_limits) noexcept;
int distance(const coordinate& a, const coordinate& b) noexcept;

std::array<coordinate, direction_count> neighbors(const coordinate& c) noexcept;
grid::result<coordinate> neighbor(const coordinate& c, int dir) noexcept;

grid::result<glm::vec3> to_world(const coordinate& c, edge_length_t edge);

std::string to_string(const coordinate& c);
std::string_view to_string(kind k) noexcept;

} // namespace tri

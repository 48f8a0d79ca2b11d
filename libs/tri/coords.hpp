#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

#include <libs/geom/morton.hpp>
#include <libs/grid/errc.hpp>
#include <libs/grid/limits.hpp>

/**
 * Triangle cell coordinates.
 *
 *   cube(x, y, z)  x + y + z == 0
 *   axial(q, r)    q = x, r = z; r is the row, q walks along the row
 *   offset         col/row with every odd row shoved by half a column
 *
 * Orientation is never stored: a cell is upward when q + r is even.
 */
namespace tri {

struct cube {
  int x = 0;
  int y = 0;
  int z = 0;

  friend constexpr auto operator<=>(const cube&, const cube&) noexcept = default;
};

struct axial {
  int q = 0;
  int r = 0;

  friend constexpr auto operator<=>(const axial&, const axial&) noexcept = default;
};

struct offset {
  int col = 0;
  int row = 0;

  friend constexpr auto operator<=>(const offset&, const offset&) noexcept = default;
};

template <typename T>
concept coordinate_type = std::same_as<T, cube> || std::same_as<T, axial> || std::same_as<T, offset>;

enum class orientation { upward, downward };

constexpr axial to_axial(axial a) noexcept { return a; }
constexpr axial to_axial(cube c) noexcept { return {c.x, c.z}; }
constexpr axial to_axial(offset o) noexcept { return {o.col - (o.row - (o.row & 1)) / 2, o.row}; }

constexpr cube to_cube(axial a) noexcept { return {a.q, -a.q - a.r, a.r}; }
constexpr offset to_offset(axial a) noexcept { return {a.q + (a.r - (a.r & 1)) / 2, a.r}; }

template <coordinate_type C>
constexpr cube to_cube(C c) noexcept {
  if constexpr (std::same_as<C, cube>)
    return c;
  else
    return to_cube(to_axial(c));
}

template <coordinate_type To, coordinate_type From>
constexpr To convert(From from) noexcept {
  const axial pivot = to_axial(from);
  if constexpr (std::same_as<To, axial>)
    return pivot;
  else if constexpr (std::same_as<To, cube>)
    return to_cube(pivot);
  else
    return to_offset(pivot);
}

template <coordinate_type To, coordinate_type From>
std::vector<To> convert_all(std::span<const From> from) {
  std::vector<To> res;
  res.reserve(from.size());
  for (From c : from)
    res.push_back(convert<To>(c));
  return res;
}

template <coordinate_type C>
constexpr orientation orientation_of(C c) noexcept {
  const axial a = to_axial(c);
  return ((a.q + a.r) & 1) == 0 ? orientation::upward : orientation::downward;
}

template <coordinate_type C>
constexpr bool is_upward(C c) noexcept {
  return orientation_of(c) == orientation::upward;
}

constexpr bool is_valid(cube c, const grid::limits& lim = grid::default_limits) noexcept {
  return c.x + c.y + c.z == 0 && lim.contains_all(c.x, c.y, c.z);
}
constexpr bool is_valid(axial a, const grid::limits& lim = grid::default_limits) noexcept {
  return is_valid(to_cube(a), lim);
}
constexpr bool is_valid(offset o, const grid::limits& lim = grid::default_limits) noexcept {
  return is_valid(to_cube(o), lim);
}

constexpr grid::result<cube> make_cube(int x, int y, int z) noexcept {
  if (x + y + z != 0)
    return std::unexpected(grid::errc::invariant_violation);
  return cube{x, y, z};
}

constexpr cube add(cube a, cube b) noexcept { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
constexpr cube subtract(cube a, cube b) noexcept { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
constexpr axial add(axial a, axial b) noexcept { return {a.q + b.q, a.r + b.r}; }
constexpr axial subtract(axial a, axial b) noexcept { return {a.q - b.q, a.r - b.r}; }

template <coordinate_type C>
constexpr uint64_t hash_value(C c) noexcept {
  const axial a = to_axial(c);
  return morton::code(a.q, a.r);
}

} // namespace tri

namespace std {
template <tri::coordinate_type C>
struct hash<C> {
  size_t operator()(C c) const noexcept { return static_cast<size_t>(tri::hash_value(c)); }
};
} // namespace std

#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <type_traits>
#include <vector>

#include <libs/geom/morton.hpp>
#include <libs/grid/errc.hpp>
#include <libs/grid/limits.hpp>

/**
 * Hexagon cell coordinates.
 *
 * Cube and axial forms are canonical, every other form converts through axial:
 *
 *   cube(x, y, z)  x + y + z == 0
 *   axial(q, r)    q = x, r = z, y = -q - r
 *   offset_odd_q   odd columns are shoved by half a cell
 *   offset_even_q  even columns are shoved by half a cell
 *   doubled        col = q, row = 2r + q; (col + row) is always even
 */
namespace hex {

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

struct offset_odd_q {
  int col = 0;
  int row = 0;

  friend constexpr auto operator<=>(const offset_odd_q&, const offset_odd_q&) noexcept = default;
};

struct offset_even_q {
  int col = 0;
  int row = 0;

  friend constexpr auto operator<=>(const offset_even_q&, const offset_even_q&) noexcept = default;
};

struct doubled {
  int col = 0;
  int row = 0;

  friend constexpr auto operator<=>(const doubled&, const doubled&) noexcept = default;
};

template <typename T>
concept coordinate_type = std::same_as<T, cube> || std::same_as<T, axial> || std::same_as<T, offset_odd_q> ||
                          std::same_as<T, offset_even_q> || std::same_as<T, doubled>;

template <typename T>
concept offset_type = std::same_as<T, offset_odd_q> || std::same_as<T, offset_even_q>;

// to axial

constexpr axial to_axial(axial a) noexcept { return a; }
constexpr axial to_axial(cube c) noexcept { return {c.x, c.z}; }
constexpr axial to_axial(offset_odd_q o) noexcept { return {o.col, o.row - (o.col - (o.col & 1)) / 2}; }
constexpr axial to_axial(offset_even_q o) noexcept { return {o.col, o.row - (o.col + (o.col & 1)) / 2}; }
/// Precondition: (col + row) is even, see is_valid and nearest_valid_doubled.
constexpr axial to_axial(doubled d) noexcept { return {d.col, (d.row - d.col) / 2}; }

// from axial

constexpr cube to_cube(axial a) noexcept { return {a.q, -a.q - a.r, a.r}; }
constexpr offset_odd_q to_offset_odd_q(axial a) noexcept { return {a.q, a.r + (a.q - (a.q & 1)) / 2}; }
constexpr offset_even_q to_offset_even_q(axial a) noexcept { return {a.q, a.r + (a.q + (a.q & 1)) / 2}; }
constexpr doubled to_doubled(axial a) noexcept { return {a.q, 2 * a.r + a.q}; }

template <coordinate_type C>
constexpr cube to_cube(C c) noexcept {
  if constexpr (std::same_as<C, cube>)
    return c;
  else
    return to_cube(to_axial(c));
}

/// Any to any conversion. Always pivots through axial.
template <coordinate_type To, coordinate_type From>
constexpr To convert(From from) noexcept {
  const axial pivot = to_axial(from);
  if constexpr (std::same_as<To, axial>)
    return pivot;
  else if constexpr (std::same_as<To, cube>)
    return to_cube(pivot);
  else if constexpr (std::same_as<To, offset_odd_q>)
    return to_offset_odd_q(pivot);
  else if constexpr (std::same_as<To, offset_even_q>)
    return to_offset_even_q(pivot);
  else
    return to_doubled(pivot);
}

template <coordinate_type To, coordinate_type From>
std::vector<To> convert_all(std::span<const From> from) {
  std::vector<To> res;
  res.reserve(from.size());
  for (From c : from)
    res.push_back(convert<To>(c));
  return res;
}

// validation

constexpr bool is_doubled_parity(int col, int row) noexcept { return ((col + row) & 1) == 0; }

constexpr bool is_valid(cube c, const grid::limits& lim = grid::default_limits) noexcept {
  return c.x + c.y + c.z == 0 && lim.contains_all(c.x, c.y, c.z);
}
// Derived forms are valid when their cube form is, so one cell gets one answer in every representation.
constexpr bool is_valid(axial a, const grid::limits& lim = grid::default_limits) noexcept {
  return is_valid(to_cube(a), lim);
}
template <offset_type O>
constexpr bool is_valid(O o, const grid::limits& lim = grid::default_limits) noexcept {
  return is_valid(to_cube(o), lim);
}
constexpr bool is_valid(doubled d, const grid::limits& lim = grid::default_limits) noexcept {
  return is_doubled_parity(d.col, d.row) && is_valid(to_cube(d), lim);
}

/// Strict constructors: report broken invariants instead of adjusting.
constexpr grid::result<cube> make_cube(int x, int y, int z) noexcept {
  if (x + y + z != 0)
    return std::unexpected(grid::errc::invariant_violation);
  return cube{x, y, z};
}

constexpr grid::result<doubled> make_doubled(int col, int row) noexcept {
  if (!is_doubled_parity(col, row))
    return std::unexpected(grid::errc::invariant_violation);
  return doubled{col, row};
}

/**
 * Closest doubled coordinate satisfying the parity rule. Valid input is
 * returned as is, otherwise the component with the smaller magnitude (col on
 * ties) is moved one unit away from zero.
 */
constexpr doubled nearest_valid_doubled(int col, int row) noexcept {
  if (is_doubled_parity(col, row))
    return {col, row};
  const auto away_from_zero = [](int v) { return v >= 0 ? v + 1 : v - 1; };
  const auto magnitude = [](int v) { return v < 0 ? -v : v; };
  if (magnitude(col) <= magnitude(row))
    return {away_from_zero(col), row};
  return {col, away_from_zero(row)};
}

// arithmetic, canonical forms only

constexpr cube add(cube a, cube b) noexcept { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
constexpr cube subtract(cube a, cube b) noexcept { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
constexpr cube scale(cube c, int k) noexcept { return {c.x * k, c.y * k, c.z * k}; }

constexpr axial add(axial a, axial b) noexcept { return {a.q + b.q, a.r + b.r}; }
constexpr axial subtract(axial a, axial b) noexcept { return {a.q - b.q, a.r - b.r}; }
constexpr axial scale(axial a, int k) noexcept { return {a.q * k, a.r * k}; }

// hashing

/// Morton code of the axial form. Equal cells have equal codes in every representation.
template <coordinate_type C>
constexpr uint64_t hash_value(C c) noexcept {
  const axial a = to_axial(c);
  return morton::code(a.q, a.r);
}

} // namespace hex

namespace std {
template <hex::coordinate_type C>
struct hash<C> {
  size_t operator()(C c) const noexcept { return static_cast<size_t>(hex::hash_value(c)); }
};
} // namespace std

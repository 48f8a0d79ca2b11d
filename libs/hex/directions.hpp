#pragma once

#include <array>
#include <cstddef>

#include <libs/hex/coords.hpp>

namespace hex {

inline constexpr size_t direction_count = 6;

/**
 * Edge directions. With the pointy_top layout direction i points at
 * -60deg * i from +x.
 *
 * Walking direction (i + 2) % 6 from the corner at direction i reaches the
 * corner at direction i + 1, which is what ring traversal relies on.
 */
inline constexpr std::array<axial, direction_count> axial_directions{
    {{1, 0}, {1, -1}, {0, -1}, {-1, 0}, {-1, 1}, {0, 1}}
};

inline constexpr std::array<cube, direction_count> cube_directions = [] {
  std::array<cube, direction_count> res;
  for (size_t i = 0; i < direction_count; ++i)
    res[i] = to_cube(axial_directions[i]);
  return res;
}();

inline constexpr std::array<doubled, direction_count> doubled_directions = [] {
  std::array<doubled, direction_count> res;
  for (size_t i = 0; i < direction_count; ++i)
    res[i] = to_doubled(axial_directions[i]);
  return res;
}();

/// col/row delta for an offset coordinate
struct offset_delta {
  int col = 0;
  int row = 0;

  friend constexpr bool operator==(const offset_delta&, const offset_delta&) noexcept = default;
};

using parity_directions = std::array<std::array<offset_delta, direction_count>, 2>;

/**
 * Offset direction tables indexed by [col & 1][direction]. The same axial step
 * changes row by a different amount depending on the column parity; odd-q and
 * even-q tables are the same two rows swapped.
 */
inline constexpr parity_directions odd_q_directions{{
    // even column
    {{{1, 0}, {1, -1}, {0, -1}, {-1, -1}, {-1, 0}, {0, 1}}},
    // odd column
    {{{1, 1}, {1, 0}, {0, -1}, {-1, 0}, {-1, 1}, {0, 1}}},
}};

inline constexpr parity_directions even_q_directions{{
    // even column
    {{{1, 1}, {1, 0}, {0, -1}, {-1, 0}, {-1, 1}, {0, 1}}},
    // odd column
    {{{1, 0}, {1, -1}, {0, -1}, {-1, -1}, {-1, 0}, {0, 1}}},
}};

template <offset_type O>
constexpr const parity_directions& directions_table() noexcept {
  if constexpr (std::same_as<O, offset_odd_q>)
    return odd_q_directions;
  else
    return even_q_directions;
}

/// Unchecked single step; direction must be below direction_count.
constexpr cube step(cube c, size_t dir) noexcept { return add(c, cube_directions[dir]); }
constexpr axial step(axial a, size_t dir) noexcept { return add(a, axial_directions[dir]); }
constexpr doubled step(doubled d, size_t dir) noexcept {
  return {d.col + doubled_directions[dir].col, d.row + doubled_directions[dir].row};
}
template <offset_type O>
constexpr O step(O o, size_t dir) noexcept {
  const offset_delta delta = directions_table<O>()[o.col & 1][dir];
  return {o.col + delta.col, o.row + delta.row};
}

template <coordinate_type C>
constexpr grid::result<C> neighbor(C c, int dir) noexcept {
  if (dir < 0 || dir >= static_cast<int>(direction_count))
    return std::unexpected(grid::errc::invalid_argument);
  return step(c, static_cast<size_t>(dir));
}

/// All six edge neighbors, ordered as the direction tables.
template <coordinate_type C>
constexpr std::array<C, direction_count> neighbors(C c) noexcept {
  std::array<C, direction_count> res;
  for (size_t i = 0; i < direction_count; ++i)
    res[i] = step(c, i);
  return res;
}

} // namespace hex

#pragma once

#include <array>
#include <cstddef>

#include <libs/tri/coords.hpp>

namespace tri {

inline constexpr size_t direction_count = 3;

/**
 * Axial steps across each edge, indexed by [orientation][direction]. Upward
 * cells leave through the right, left and bottom edges; downward cells through
 * the left, right and top edges. Every step flips the orientation.
 */
inline constexpr std::array<std::array<axial, direction_count>, 2> edge_directions{{
    {{{1, 0}, {-1, 0}, {0, -1}}},
    {{{-1, 0}, {1, 0}, {0, 1}}},
}};

constexpr const std::array<axial, direction_count>& directions_of(orientation o) noexcept {
  return edge_directions[static_cast<size_t>(o)];
}

/// Unchecked step across an edge; direction must be below direction_count.
template <coordinate_type C>
constexpr C step(C c, size_t dir) noexcept {
  const axial a = to_axial(c);
  return convert<C>(add(a, directions_of(orientation_of(a))[dir]));
}

template <coordinate_type C>
constexpr grid::result<C> neighbor(C c, int dir) noexcept {
  if (dir < 0 || dir >= static_cast<int>(direction_count))
    return std::unexpected(grid::errc::invalid_argument);
  return step(c, static_cast<size_t>(dir));
}

/// The three cells sharing an edge with `c`.
template <coordinate_type C>
constexpr std::array<C, direction_count> neighbors(C c) noexcept {
  std::array<C, direction_count> res;
  for (size_t i = 0; i < direction_count; ++i)
    res[i] = step(c, i);
  return res;
}

} // namespace tri

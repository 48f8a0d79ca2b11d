#include <string>
#include <system_error>

#include <fmt/format.h>

#include "cells.hpp"

namespace {

template <typename C>
C within_limits(std::string_view name, std::string_view text, C cell, const grid::limits& lim) {
  if (!is_valid(cell, lim))
    bad_option(name, text, fmt::format("outside of grid limits [{}, {}]", lim.min_value, lim.max_value));
  return cell;
}

} // namespace

void bad_option(std::string_view name, std::string_view val, std::string_view reason) {
  throw std::system_error{
      std::make_error_code(std::errc::invalid_argument), fmt::format("{} '{}': {}", name, val, reason)
  };
}

hex::coordinate hex_cell(std::string_view name, std::string_view text, std::string_view kind, const grid::limits& lim) {
  const cell_text cell = unwrap(name, text, parse_cell(text));
  const auto [a, b, c] = cell.values;
  if (cell.count == 3) {
    if (!hex::make_cube(a, b, c))
      bad_option(name, text, "cube coordinates must sum up to zero");
    return within_limits(name, text, hex::coordinate{hex::cube{a, b, c}}, lim);
  }
  if (kind == "axial")
    return within_limits(name, text, hex::coordinate{hex::axial{a, b}}, lim);
  if (kind == "odd_q")
    return within_limits(name, text, hex::coordinate{hex::offset_odd_q{a, b}}, lim);
  if (kind == "even_q")
    return within_limits(name, text, hex::coordinate{hex::offset_even_q{a, b}}, lim);
  if (kind == "doubled") {
    if (!hex::is_doubled_parity(a, b))
      bad_option(name, text, "doubled column and row must have the same parity");
    return within_limits(name, text, hex::coordinate{hex::doubled{a, b}}, lim);
  }
  bad_option("--kind", kind, "unknown hex representation");
}

tri::coordinate tri_cell(std::string_view name, std::string_view text, std::string_view kind, const grid::limits& lim) {
  const cell_text cell = unwrap(name, text, parse_cell(text));
  const auto [a, b, c] = cell.values;
  if (cell.count == 3) {
    if (!tri::make_cube(a, b, c))
      bad_option(name, text, "cube coordinates must sum up to zero");
    return within_limits(name, text, tri::coordinate{tri::cube{a, b, c}}, lim);
  }
  if (kind == "axial")
    return within_limits(name, text, tri::coordinate{tri::axial{a, b}}, lim);
  if (kind == "offset")
    return within_limits(name, text, tri::coordinate{tri::offset{a, b}}, lim);
  bad_option("--kind", kind, "unknown triangle representation");
}

#pragma once

#include <expected>
#include <string_view>

#include <libs/grid/limits.hpp>
#include <libs/hex/coordinate.hpp>
#include <libs/tri/coordinate.hpp>

#include "parse_cell.hpp"

/// Throws std::system_error with std::errc::invalid_argument naming the option and its value.
[[noreturn]] void bad_option(std::string_view name, std::string_view val, std::string_view reason);

template <typename T>
T unwrap(std::string_view name, std::string_view val, const std::expected<T, cell_parse_error>& res) {
  if (!res)
    bad_option(name, val, to_string(res.error()));
  return *res;
}

/**
 * Cell given on the command line. Three values are cube coordinates, two are
 * read in the representation named by `kind`. Cells breaking an invariant or
 * lying outside `lim` are reported through bad_option.
 */
hex::coordinate hex_cell(
    std::string_view name, std::string_view text, std::string_view kind, const grid::limits& lim = grid::default_limits
);
tri::coordinate tri_cell(
    std::string_view name, std::string_view text, std::string_view kind, const grid::limits& lim = grid::default_limits
);

#pragma once

#include <array>
#include <cstddef>
#include <expected>
#include <string_view>

enum class cell_parse_error {
  empty_input,
  not_a_number,
  wrong_arity
};

/// Two or three comma separated integers, e.g. "3,-2" or "1, -3, 2".
struct cell_text {
  std::array<int, 3> values{};
  size_t count = 0;
};

std::expected<cell_text, cell_parse_error> parse_cell(std::string_view text);

std::expected<int, cell_parse_error> parse_int(std::string_view text);
std::expected<float, cell_parse_error> parse_float(std::string_view text);

std::string_view to_string(cell_parse_error err) noexcept;

#include <charconv>
#include <string_view>
#include <system_error>

#include "parse_cell.hpp"

namespace {

constexpr std::string_view trim(std::string_view in) noexcept {
  while (!in.empty() && (in.front() == ' ' || in.front() == '\t'))
    in.remove_prefix(1);
  while (!in.empty() && (in.back() == ' ' || in.back() == '\t'))
    in.remove_suffix(1);
  return in;
}

template <typename T>
std::expected<T, cell_parse_error> parse_number(std::string_view text) {
  text = trim(text);
  if (text.empty())
    return std::unexpected(cell_parse_error::empty_input);
  if (text.front() == '+')
    text.remove_prefix(1);
  T res{};
  const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), res);
  if (ec != std::errc{} || end != text.data() + text.size())
    return std::unexpected(cell_parse_error::not_a_number);
  return res;
}

} // namespace

std::expected<cell_text, cell_parse_error> parse_cell(std::string_view text) {
  if (trim(text).empty())
    return std::unexpected(cell_parse_error::empty_input);

  cell_text res;
  while (true) {
    const size_t sep = text.find(',');
    if (res.count == res.values.size())
      return std::unexpected(cell_parse_error::wrong_arity);
    const auto val = parse_int(text.substr(0, sep));
    if (!val)
      return std::unexpected(val.error());
    res.values[res.count++] = *val;
    if (sep == std::string_view::npos)
      break;
    text.remove_prefix(sep + 1);
  }
  if (res.count < 2)
    return std::unexpected(cell_parse_error::wrong_arity);
  return res;
}

std::expected<int, cell_parse_error> parse_int(std::string_view text) { return parse_number<int>(text); }

std::expected<float, cell_parse_error> parse_float(std::string_view text) { return parse_number<float>(text); }

std::string_view to_string(cell_parse_error err) noexcept {
  switch (err) {
  case cell_parse_error::empty_input: return "empty value";
  case cell_parse_error::not_a_number: return "not a number";
  case cell_parse_error::wrong_arity: return "expected two or three comma separated integers";
  }
  return "unknown error";
}

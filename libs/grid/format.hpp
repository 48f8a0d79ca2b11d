#pragma once

#include <string_view>

#include <fmt/format.h>

#include <libs/grid/errc.hpp>

namespace fmt {

template <>
struct formatter<grid::errc> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(grid::errc err, FormatContext& ctx) const {
    return formatter<std::string_view>::format(make_error_code(err).message(), ctx);
  }
};

} // namespace fmt

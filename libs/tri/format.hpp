#pragma once

#include <string>
#include <string_view>

#include <fmt/format.h>

#include <libs/tri/coords.hpp>

namespace tri {

inline std::string to_string(cube c) { return fmt::format("tri::cube({}, {}, {})", c.x, c.y, c.z); }
inline std::string to_string(axial a) { return fmt::format("tri::axial({}, {})", a.q, a.r); }
inline std::string to_string(offset o) { return fmt::format("tri::offset({}, {})", o.col, o.row); }

inline std::string_view to_string(orientation o) noexcept {
  return o == orientation::upward ? "upward" : "downward";
}

} // namespace tri

namespace fmt {

template <tri::coordinate_type C>
struct formatter<C> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(C c, FormatContext& ctx) const {
    return formatter<std::string_view>::format(tri::to_string(c), ctx);
  }
};

} // namespace fmt

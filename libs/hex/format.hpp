#pragma once

#include <string>
#include <string_view>

#include <fmt/format.h>

#include <libs/hex/coords.hpp>

namespace hex {

inline std::string to_string(cube c) { return fmt::format("cube({}, {}, {})", c.x, c.y, c.z); }
inline std::string to_string(axial a) { return fmt::format("axial({}, {})", a.q, a.r); }
inline std::string to_string(offset_odd_q o) { return fmt::format("odd_q({}, {})", o.col, o.row); }
inline std::string to_string(offset_even_q o) { return fmt::format("even_q({}, {})", o.col, o.row); }
inline std::string to_string(doubled d) { return fmt::format("doubled({}, {})", d.col, d.row); }

} // namespace hex

namespace fmt {

template <hex::coordinate_type C>
struct formatter<C> : formatter<std::string_view> {
  template <typename FormatContext>
  auto format(C c, FormatContext& ctx) const {
    return formatter<std::string_view>::format(hex::to_string(c), ctx);
  }
};

} // namespace fmt

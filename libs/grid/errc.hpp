#pragma once

#include <expected>
#include <system_error>

namespace grid {

enum class errc {
  invalid_argument = 1,
  invariant_violation,
  degenerate_input
};

const std::error_category& category() noexcept;

inline std::error_code make_error_code(errc err) noexcept {
  return {static_cast<int>(err), category()};
}

template <typename T>
using result = std::expected<T, errc>;

} // namespace grid

namespace std {
template <>
struct is_error_code_enum<grid::errc> : std::true_type {};
} // namespace std

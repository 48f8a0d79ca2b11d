#pragma once

#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

/// Removes every occurrence of the flag from args. Returns true if there was one.
bool get_flag(std::span<char*>& args, std::string_view flag) noexcept;
/// Removes the first `option value` pair from args and returns the value.
const char* get_option(std::span<char*>& args, std::string_view option) noexcept;

template <typename T>
std::decay_t<T> get_option(std::span<char*>& args, std::string_view option, T&& default_val) noexcept {
  const char* val = get_option(args, option);
  if (!val)
    return std::forward<T>(default_val);
  return std::decay_t<T>{val};
}

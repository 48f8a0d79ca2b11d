#pragma once

#include <cstdint>

namespace morton {

constexpr uint64_t interleave_1(uint32_t val) noexcept {
  constexpr uint64_t shifts[] = {16, 8, 4, 2, 1};
  // clang-format off
  constexpr uint64_t masks[] = {
    0x0000'ffff'0000'ffff,
    0x00ff'00ff'00ff'00ff,
    0x0f0f'0f0f'0f0f'0f0f,
    0x3333'3333'3333'3333,
    0x5555'5555'5555'5555
  };
  // clang-format on

  uint64_t r = val;
  r = (r | (r << shifts[0])) & masks[0];
  r = (r | (r << shifts[1])) & masks[1];
  r = (r | (r << shifts[2])) & masks[2];
  r = (r | (r << shifts[3])) & masks[3];
  r = (r | (r << shifts[4])) & masks[4];
  return r;
}

/**
 * Maps signed values onto unsigned ones keeping small magnitudes small:
 * 0 -> 0, -1 -> 1, 1 -> 2, -2 -> 3 ...
 * Lattice coordinates around the origin therefore get compact codes.
 */
constexpr uint32_t zigzag(int32_t val) noexcept {
  return (static_cast<uint32_t>(val) << 1) ^ static_cast<uint32_t>(val >> 31);
}

constexpr uint64_t code(uint32_t x, uint32_t y) noexcept { return interleave_1(x) | (interleave_1(y) << 1); }

constexpr uint64_t code(int32_t x, int32_t y) noexcept { return code(zigzag(x), zigzag(y)); }

} // namespace morton

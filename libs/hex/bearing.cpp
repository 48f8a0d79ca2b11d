#include <cmath>
#include <numbers>

#include <libs/hex/bearing.hpp>

namespace hex {

namespace {

constexpr float full_turn = 360.f;
constexpr float sector = full_turn / 8.f;

float normalize(float degrees) noexcept {
  const float res = std::fmod(degrees, full_turn);
  // tiny negative angles round up to a full turn
  return res < 0.f ? std::fmod(res + full_turn, full_turn) : res;
}

} // namespace

float bearing_degrees(axial from, axial to, const layout& l) noexcept {
  const glm::vec2 dir = l.forward * glm::vec2{to.q - from.q, to.r - from.r};
  if (dir == glm::vec2{0.f})
    return 0.f;
  return normalize(std::atan2(dir.y, dir.x) * 180.f / std::numbers::pi_v<float>);
}

compass compass_direction(float degrees) noexcept {
  const auto idx = static_cast<int>(std::floor((normalize(degrees) + sector / 2.f) / sector)) % 8;
  return static_cast<compass>(idx);
}

std::string_view to_string(compass dir) noexcept {
  switch (dir) {
  case compass::east: return "east";
  case compass::north_east: return "north-east";
  case compass::north: return "north";
  case compass::north_west: return "north-west";
  case compass::west: return "west";
  case compass::south_west: return "south-west";
  case compass::south: return "south";
  case compass::south_east: return "south-east";
  }
  return "unknown";
}

} // namespace hex

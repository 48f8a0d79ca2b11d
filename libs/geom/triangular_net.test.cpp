#include <cmath>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_adapters.hpp>
#include <catch2/generators/catch_generators_random.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <fmt/format.h>

#include <libs/geom/triangular_net.hpp>

using Catch::Generators::random;

namespace Catch {

template <>
struct StringMaker<triangular::point> {
  static std::string convert(triangular::point pt) { return fmt::format("{{x: {}, y: {}}}", pt.x, pt.y); }
};

} // namespace Catch

TEST_CASE("triangular zero point is cartesian zero point", "[triangular]") {
  CHECK(triangular::to_cartesian({0, 0}) == glm::vec2{0.});
}

TEST_CASE("triangular to cartesian", "[triangular]") {
  const int tx = GENERATE(take(15, random(-50, 50)));
  const int ty = GENERATE(take(15, random(-50, 50)));
  CAPTURE(tx, ty);

  SECTION("x coordinate calculated properly") {
    CHECK_THAT(
        triangular::to_cartesian({tx, ty}).x, Catch::Matchers::WithinAbs(tx + ty * std::cos(M_PI / 3), 0.0001)
    );
  }

  SECTION("y coordinate calculated properly") {
    CHECK_THAT(triangular::to_cartesian({tx, ty}).y, Catch::Matchers::WithinAbs(ty * std::sin(M_PI / 3), 0.0001));
  }

  SECTION("from_cartesian restores lattice coordinates") {
    const glm::vec2 restored = triangular::from_cartesian(triangular::to_cartesian({tx, ty}));
    CHECK_THAT(restored.x, Catch::Matchers::WithinAbs(tx, 0.001));
    CHECK_THAT(restored.y, Catch::Matchers::WithinAbs(ty, 0.001));
  }
}

TEST_CASE("from_cartesian of a rhombus interior point stays inside the rhombus", "[triangular]") {
  const triangular::point corner{3, -2};
  const glm::vec2 center = (triangular::to_cartesian(corner) + triangular::to_cartesian(corner + triangular::point{1, 1})) / 2.f;
  const glm::vec2 frac = triangular::from_cartesian(center);
  CHECK(std::floor(frac.x) == corner.x);
  CHECK(std::floor(frac.y) == corner.y);
}

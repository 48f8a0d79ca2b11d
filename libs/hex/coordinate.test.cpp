#include <string>

#include <mp-units/systems/si.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <fmt/format.h>

#include <testing/matchers/expected.hpp>
#include <testing/printers/coords.hpp>
#include <testing/printers/expected.hpp>

#include <libs/hex/coordinate.hpp>
#include <libs/hex/format.hpp>

using namespace mp_units::si::unit_symbols;

namespace Catch {

template <>
struct StringMaker<hex::coordinate> {
  static std::string convert(const hex::coordinate& c) { return hex::to_string(c); }
};

} // namespace Catch

TEST_CASE("coordinate kind follows the stored alternative", "[hex][coordinate]") {
  CHECK(hex::kind_of(hex::coordinate{hex::cube{1, -1, 0}}) == hex::kind::cube);
  CHECK(hex::kind_of(hex::coordinate{hex::axial{1, -1}}) == hex::kind::axial);
  CHECK(hex::kind_of(hex::coordinate{hex::offset_odd_q{1, -1}}) == hex::kind::odd_q);
  CHECK(hex::kind_of(hex::coordinate{hex::offset_even_q{1, -1}}) == hex::kind::even_q);
  CHECK(hex::kind_of(hex::coordinate{hex::doubled{1, -1}}) == hex::kind::doubled);
}

TEST_CASE("coordinate conversion by kind", "[hex][coordinate]") {
  const hex::axial cell{-3, 2};
  const auto to = GENERATE(hex::kind::cube, hex::kind::axial, hex::kind::odd_q, hex::kind::even_q, hex::kind::doubled);
  CAPTURE(hex::to_string(to));

  const hex::coordinate converted = hex::convert(hex::coordinate{cell}, to);
  CHECK(hex::kind_of(converted) == to);
  CHECK(hex::to_axial(converted) == cell);
  CHECK(hex::to_cube(converted) == hex::to_cube(cell));
  CHECK(hex::is_valid(converted));
}

TEST_CASE("coordinate neighbors keep the representation", "[hex][coordinate]") {
  const hex::coordinate c = hex::offset_even_q{3, -1};
  for (const hex::coordinate& n : hex::neighbors(c)) {
    CAPTURE(n);
    CHECK(hex::kind_of(n) == hex::kind::even_q);
    CHECK(hex::distance(n, c) == 1);
  }
  CHECK_THAT(hex::neighbor(c, 0), is_expected(hex::coordinate{hex::offset_even_q{4, -1}}));
  CHECK_THAT(hex::neighbor(c, 6), is_unexpected(grid::errc::invalid_argument));
}

TEST_CASE("coordinate validity", "[hex][coordinate]") {
  CHECK_FALSE(hex::is_valid(hex::coordinate{hex::doubled{3, -2}}));
  CHECK_FALSE(hex::is_valid(hex::coordinate{hex::cube{1, 1, 1}}));
  CHECK(hex::is_valid(hex::coordinate{hex::doubled{4, -2}}));
}

TEST_CASE("coordinate distance across kinds", "[hex][coordinate]") {
  CHECK(hex::distance(hex::coordinate{hex::axial{0, 0}}, hex::coordinate{hex::to_doubled(hex::axial{3, -2})}) == 3);
}

TEST_CASE("coordinate world position", "[hex][coordinate]") {
  const hex::coordinate c = hex::doubled{2, 0};
  CHECK(hex::to_world(c, 1.f * m) == hex::to_world(hex::axial{2, -1}, 1.f * m));
  CHECK_THAT(hex::to_world(c, 0.f * m), is_unexpected(grid::errc::degenerate_input));
}

TEST_CASE("string form", "[hex][format]") {
  CHECK(hex::to_string(hex::coordinate{hex::cube{1, -3, 2}}) == "cube(1, -3, 2)");
  CHECK(hex::to_string(hex::coordinate{hex::axial{1, 2}}) == "axial(1, 2)");
  CHECK(fmt::format("{}", hex::offset_odd_q{0, -1}) == "odd_q(0, -1)");
  CHECK(fmt::format("{}", hex::offset_even_q{5, 6}) == "even_q(5, 6)");
  CHECK(fmt::format("{}", hex::doubled{4, -2}) == "doubled(4, -2)");
  CHECK(fmt::format("[{:>14}]", hex::axial{1, 2}) == "[   axial(1, 2)]");
  CHECK(hex::to_string(hex::kind::odd_q) == "odd_q");
}

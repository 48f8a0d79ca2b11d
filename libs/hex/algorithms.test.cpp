#include <algorithm>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_range.hpp>
#include <catch2/matchers/catch_matchers_container_properties.hpp>
#include <catch2/matchers/catch_matchers_predicate.hpp>
#include <catch2/matchers/catch_matchers_quantifiers.hpp>
#include <catch2/matchers/catch_matchers_range_equals.hpp>

#include <testing/matchers/expected.hpp>
#include <testing/matchers/ranges.hpp>
#include <testing/printers/coords.hpp>
#include <testing/printers/expected.hpp>

#include <libs/hex/algorithms.hpp>

using Catch::Matchers::AllMatch;
using Catch::Matchers::IsEmpty;
using Catch::Matchers::Predicate;
using Catch::Matchers::RangeEquals;
using Catch::Matchers::SizeIs;

namespace {

auto within(hex::axial center, int radius) {
  return Predicate<hex::axial>(
      [=](hex::axial c) { return hex::distance(c, center) <= radius; }, "is within the radius"
  );
}

auto at_distance(hex::axial center, int radius) {
  return Predicate<hex::axial>(
      [=](hex::axial c) { return hex::distance(c, center) == radius; }, "is exactly at the radius"
  );
}

} // namespace

TEST_CASE("distance", "[hex]") {
  SECTION("known value") { CHECK(hex::distance(hex::axial{0, 0}, hex::axial{3, -2}) == 3); }

  SECTION("is zero for the same cell and symmetric") {
    const hex::axial a{GENERATE(-7, 0, 4), 2};
    const hex::axial b{-1, GENERATE(-5, 0, 3)};
    CAPTURE(a, b);
    CHECK(hex::distance(a, a) == 0);
    CHECK(hex::distance(a, b) == hex::distance(b, a));
  }

  SECTION("does not depend on representation") {
    const hex::axial a{-4, 3};
    const hex::axial b{2, -5};
    const int expected = hex::distance(a, b);
    CHECK(hex::distance(hex::to_offset_odd_q(a), hex::to_doubled(b)) == expected);
    CHECK(hex::distance(hex::to_cube(a), hex::to_offset_even_q(b)) == expected);
  }
}

TEST_CASE("range", "[hex]") {
  const hex::axial center{2, -3};

  SECTION("is a filled disk") {
    const int radius = GENERATE(range(0, 6));
    CAPTURE(radius);
    const std::vector<hex::axial> cells = hex::range(center, radius);
    CHECK_THAT(cells, SizeIs(3 * radius * radius + 3 * radius + 1));
    CHECK_THAT(cells, are_unique());
    CHECK_THAT(cells, AllMatch(within(center, radius)));
  }

  SECTION("keeps the zero sum invariant") {
    for (const hex::cube& c : hex::range(hex::to_cube(center), 4))
      REQUIRE(c.x + c.y + c.z == 0);
  }

  SECTION("is empty for negative radius") { CHECK_THAT(hex::range(center, -1), IsEmpty()); }

  SECTION("skips cells outside of limits") {
    const grid::limits lim{.min_value = -1, .max_value = 1};
    CHECK_THAT(hex::range(hex::cube{}, 2, lim), SizeIs(7));
  }

  SECTION("radius far beyond the limits is clipped to them") {
    const grid::limits lim{.min_value = -5, .max_value = 5};
    const std::vector<hex::cube> cells = hex::range(hex::cube{4, -4, 0}, 40000, lim);
    CHECK_THAT(cells, SizeIs(91));
    CHECK_THAT(cells, are_unique());
    CHECK_THAT(cells, AllMatch(Predicate<hex::cube>([&](hex::cube c) { return hex::is_valid(c, lim); })));
  }

  SECTION("membership agrees with enumeration") {
    for (const hex::axial& c : hex::range(center, 3))
      CHECK(hex::in_range(c, center, 3));
    CHECK_FALSE(hex::in_range(hex::axial{6, -3}, center, 3));
    CHECK_FALSE(hex::in_range(center, center, -1));
  }
}

TEST_CASE("ring", "[hex]") {
  const hex::axial center{-1, 4};

  SECTION("of zero radius is the center") { CHECK_THAT(hex::ring(center, 0), RangeEquals(std::vector{center})); }

  SECTION("is empty for negative radius") { CHECK_THAT(hex::ring(center, -2), IsEmpty()); }

  SECTION("has six cells per radius step") {
    const int radius = GENERATE(range(1, 6));
    CAPTURE(radius);
    const std::vector<hex::axial> cells = hex::ring(center, radius);
    CHECK_THAT(cells, SizeIs(6 * radius));
    CHECK_THAT(cells, are_unique());
    CHECK_THAT(cells, AllMatch(at_distance(center, radius)));
  }

  SECTION("is walked cell by cell") {
    const std::vector<hex::axial> cells = hex::ring(center, 3);
    for (size_t i = 0; i < cells.size(); ++i)
      CHECK(hex::distance(cells[i], cells[(i + 1) % cells.size()]) == 1);
  }

  SECTION("of radius one follows the direction table") {
    CHECK_THAT(hex::ring(hex::axial{}, 1), RangeEquals(hex::axial_directions));
  }

  SECTION("is the outline of the range") {
    const std::vector<hex::axial> disk = hex::range(center, 3);
    for (const hex::axial& c : hex::ring(center, 3))
      CHECK(std::ranges::find(disk, c) != disk.end());
  }
}

TEST_CASE("line", "[hex]") {
  SECTION("known path") {
    const hex::axial from{0, 0};
    const hex::axial to{3, -2};
    const std::vector<hex::axial> path = hex::line(from, to);
    REQUIRE_THAT(path, SizeIs(4));
    CHECK(path.front() == from);
    CHECK(path.back() == to);
  }

  SECTION("connects cells through neighbors") {
    const hex::axial from{GENERATE(-5, 0, 2), -3};
    const hex::axial to{4, GENERATE(-6, 1, 7)};
    CAPTURE(from, to);
    const std::vector<hex::axial> path = hex::line(from, to);
    REQUIRE_THAT(path, SizeIs(hex::distance(from, to) + 1));
    CHECK(path.front() == from);
    CHECK(path.back() == to);
    for (size_t i = 1; i < path.size(); ++i)
      CHECK(hex::distance(path[i - 1], path[i]) == 1);
  }

  SECTION("of a single cell") {
    const hex::offset_odd_q cell{3, 3};
    CHECK_THAT(hex::line(cell, cell), RangeEquals(std::vector{cell}));
  }
}

TEST_CASE("rotation", "[hex]") {
  const hex::cube c{1, -3, 2};

  SECTION("six steps is identity") { CHECK(hex::rotate(c, 6) == c); }
  SECTION("negative steps turn back") {
    CHECK(hex::rotate(c, -1) == hex::rotate(c, 5));
    CHECK(hex::rotate(hex::rotate(c, 2), -2) == c);
  }
  SECTION("keeps distance from the origin") { CHECK(hex::distance(hex::rotate(c, 1), hex::cube{}) == 4); }
  SECTION("moves directions along the table") {
    for (size_t i = 0; i < hex::direction_count; ++i)
      CHECK(hex::rotate(hex::cube_directions[i], 1) == hex::cube_directions[(i + 5) % hex::direction_count]);
  }
  SECTION("around a center") {
    CHECK(hex::rotate_around(hex::axial{3, 0}, hex::axial{2, 0}, 3) == hex::axial{1, 0});
    CHECK(hex::rotate_around(hex::axial{5, -1}, hex::axial{5, -1}, 2) == hex::axial{5, -1});
  }
}

TEST_CASE("reflection", "[hex]") {
  const hex::cube c{1, -3, 2};
  CHECK_THAT(hex::reflect(c, 0), is_expected(hex::cube{1, 2, -3}));
  CHECK_THAT(hex::reflect(c, 1), is_expected(hex::cube{2, -3, 1}));
  CHECK_THAT(hex::reflect(c, 2), is_expected(hex::cube{-3, 1, 2}));
  CHECK_THAT(hex::reflect(c, 3), is_unexpected(grid::errc::invalid_argument));
  CHECK_THAT(hex::reflect(c, -1), is_unexpected(grid::errc::invalid_argument));

  SECTION("twice is identity") {
    const int axis = GENERATE(0, 1, 2);
    CHECK_THAT(hex::reflect(*hex::reflect(c, axis), axis), is_expected(c));
  }
}

TEST_CASE("offset rectangle", "[hex]") {
  SECTION("is enumerated column by column") {
    const auto cells = hex::rectangle<hex::offset_odd_q>(0, 2, 0, 1);
    REQUIRE(cells.has_value());
    CHECK_THAT(
        *cells, RangeEquals(std::vector<hex::offset_odd_q>{{0, 0}, {0, 1}, {1, 0}, {1, 1}, {2, 0}, {2, 1}})
    );
    CHECK_THAT(*cells, AllMatch(Predicate<hex::offset_odd_q>([](hex::offset_odd_q o) {
                 return hex::in_rectangle(o, 0, 2, 0, 1);
               })));
  }
  SECTION("with inverted bounds is rejected") {
    CHECK_THAT(hex::rectangle<hex::offset_even_q>(3, 2, 0, 1), is_unexpected(grid::errc::invalid_argument));
    CHECK_THAT(hex::rectangle<hex::offset_even_q>(0, 2, 1, 0), is_unexpected(grid::errc::invalid_argument));
  }
  SECTION("membership") {
    CHECK_FALSE(hex::in_rectangle(hex::offset_even_q{3, 0}, 0, 2, 0, 1));
    CHECK(hex::in_rectangle(hex::offset_even_q{2, 1}, 0, 2, 0, 1));
  }
}

#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_range_equals.hpp>

#include <testing/printers/coords.hpp>

#include <libs/hex/algorithms.hpp>

using Catch::Matchers::RangeEquals;
using Catch::Matchers::WithinAbs;

TEST_CASE("cached algorithms give the same results", "[hex][cache]") {
  hex::cache_context ctx;
  const hex::axial center{GENERATE(-4, 0, 7), 3};
  CAPTURE(center);

  CHECK(hex::neighbors(center, ctx) == hex::neighbors(center));
  CHECK(hex::neighbors(center, ctx) == hex::neighbors(center));
  CHECK(hex::distance(center, hex::axial{1, 1}, ctx) == hex::distance(center, hex::axial{1, 1}));
  CHECK_THAT(hex::range(center, 3, ctx), RangeEquals(hex::range(center, 3)));
  CHECK_THAT(hex::range(center, 3, ctx), RangeEquals(hex::range(center, 3)));

  SECTION("for other representations") {
    const hex::offset_odd_q cell = hex::to_offset_odd_q(center);
    CHECK(hex::neighbors(cell, ctx) == hex::neighbors(cell));
    CHECK_THAT(hex::range(cell, 2, ctx), RangeEquals(hex::range(cell, 2)));
  }
}

TEST_CASE("cache statistics", "[hex][cache]") {
  hex::cache_context ctx;
  const hex::axial a{1, 2};
  const hex::axial b{-3, 0};

  SECTION("each table is named after what it stores") {
    CHECK(ctx.neighbors.name() == "neighbors");
    CHECK(ctx.distances.name() == "distance");
    CHECK(ctx.ranges.name() == "range");
  }

  SECTION("fresh context is empty") {
    const grid::cache_stats stats = ctx.stats();
    CHECK(stats.size == 0);
    CHECK(stats.lookups == 0);
    CHECK(stats.hit_rate == 0.);
  }

  SECTION("repeated lookups hit") {
    hex::neighbors(a, ctx);
    hex::neighbors(a, ctx);
    CHECK(ctx.neighbors.stats().size == 1);
    CHECK_THAT(ctx.neighbors.stats().hit_rate, WithinAbs(0.5, 0.0001));
  }

  SECTION("distance is stored once for both argument orders") {
    hex::distance(a, b, ctx);
    hex::distance(b, a, ctx);
    CHECK(ctx.distances.stats().size == 1);
    CHECK_THAT(ctx.distances.stats().hit_rate, WithinAbs(0.5, 0.0001));
  }

  SECTION("clear drops entries and counters") {
    hex::range(a, 2, ctx);
    ctx.clear();
    const grid::cache_stats stats = ctx.stats();
    CHECK(stats.size == 0);
    CHECK(stats.lookups == 0);
  }
}

TEST_CASE("cache never grows past its capacity", "[hex][cache]") {
  hex::cache_context ctx{5};
  for (const hex::axial& c : hex::range(hex::axial{}, 3))
    CHECK(hex::neighbors(c, ctx) == hex::neighbors(c));
  CHECK(ctx.neighbors.stats().size == 5);
  CHECK(ctx.stats().capacity == 15);
}

TEST_CASE("warm up fills neighbors of the whole range", "[hex][cache]") {
  hex::cache_context ctx;
  hex::warm_up(ctx, hex::axial{2, 2}, 2);
  CHECK(ctx.neighbors.stats().size == 19);
  CHECK(ctx.ranges.stats().size == 1);

  const size_t lookups = ctx.neighbors.stats().lookups;
  hex::neighbors(hex::axial{3, 2}, ctx);
  CHECK(ctx.neighbors.stats().lookups == lookups + 1);
  CHECK(ctx.neighbors.stats().hit_rate > 0.);
}

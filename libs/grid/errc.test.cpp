#include <string_view>
#include <system_error>

#include <catch2/catch_test_macros.hpp>

#include <fmt/format.h>

#include <libs/grid/errc.hpp>
#include <libs/grid/format.hpp>

TEST_CASE("grid error category", "[grid]") {
  SECTION("has its own name") { CHECK(std::string_view{grid::category().name()} == "grid"); }

  SECTION("converts to std::error_code") {
    const std::error_code ec = grid::errc::invalid_argument;
    CHECK(ec.category() == grid::category());
    CHECK(ec.value() == 1);
    CHECK(ec == grid::errc::invalid_argument);
    CHECK(ec != grid::errc::degenerate_input);
  }

  SECTION("describes every error") {
    CHECK(make_error_code(grid::errc::invalid_argument).message() == "Argument is outside of the accepted range");
    CHECK(
        make_error_code(grid::errc::invariant_violation).message() == "Coordinate violates its representation invariant"
    );
    CHECK(make_error_code(grid::errc::degenerate_input).message() == "Grid size or width must be positive");
    CHECK(grid::category().message(42) == "Unknown grid error");
  }

  SECTION("is formatted with its message") {
    CHECK(fmt::format("{}", grid::errc::degenerate_input) == "Grid size or width must be positive");
  }

  SECTION("can be thrown as std::system_error") {
    try {
      throw std::system_error{grid::errc::invariant_violation, "make_cube"};
    } catch (const std::system_error& err) {
      CHECK(err.code() == grid::errc::invariant_violation);
    }
  }
}

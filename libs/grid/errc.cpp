#include <libs/grid/errc.hpp>

namespace grid {

const std::error_category& category() noexcept {
  static const struct final : std::error_category {
    const char* name() const noexcept override { return "grid"; }

    std::string message(int cond) const override {
      if (cond == 0)
        return std::generic_category().message(0);
      switch (static_cast<errc>(cond)) {
      case errc::invalid_argument: return "Argument is outside of the accepted range";
      case errc::invariant_violation: return "Coordinate violates its representation invariant";
      case errc::degenerate_input: return "Grid size or width must be positive";
      }
      return "Unknown grid error";
    }
  } inst;
  return inst;
}

} // namespace grid

#include <limits>

#include <libs/tri/index.hpp>

namespace tri {

grid::result<int> to_index(offset o, int width) noexcept {
  if (width <= 0)
    return std::unexpected(grid::errc::degenerate_input);
  if (o.row < 0 || o.col < 0 || o.col >= width)
    return std::unexpected(grid::errc::invalid_argument);
  if (o.row > (std::numeric_limits<int>::max() - o.col) / width)
    return std::unexpected(grid::errc::invalid_argument);
  return o.row * width + o.col;
}

grid::result<offset> from_index(int index, int width) noexcept {
  if (width <= 0)
    return std::unexpected(grid::errc::degenerate_input);
  if (index < 0)
    return std::unexpected(grid::errc::invalid_argument);
  return offset{index % width, index / width};
}

} // namespace tri

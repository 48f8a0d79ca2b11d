#pragma once

#include <libs/grid/errc.hpp>
#include <libs/tri/coords.hpp>

namespace tri {

/**
 * Row major storage index of an offset cell in a grid `width` cells wide.
 * Cells with a negative row or a column outside [0, width) have no index.
 */
grid::result<int> to_index(offset o, int width) noexcept;
grid::result<offset> from_index(int index, int width) noexcept;

} // namespace tri

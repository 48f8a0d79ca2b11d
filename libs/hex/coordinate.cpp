#include <libs/hex/algorithms.hpp>
#include <libs/hex/coordinate.hpp>
#include <libs/hex/format.hpp>

namespace hex {

kind kind_of(const coordinate& c) noexcept { return static_cast<kind>(c.index()); }

axial to_axial(const coordinate& c) noexcept {
  return std::visit([](auto val) { return to_axial(val); }, c);
}

cube to_cube(const coordinate& c) noexcept {
  return std::visit([](auto val) { return to_cube(val); }, c);
}

coordinate convert(const coordinate& c, kind to) noexcept {
  const axial pivot = to_axial(c);
  switch (to) {
  case kind::cube: return convert<cube>(pivot);
  case kind::axial: return pivot;
  case kind::odd_q: return convert<offset_odd_q>(pivot);
  case kind::even_q: return convert<offset_even_q>(pivot);
  case kind::doubled: return convert<doubled>(pivot);
  }
  return pivot;
}

bool is_valid(const coordinate& c, const grid::limits& lim) noexcept {
  return std::visit([&lim](auto val) { return is_valid(val, lim); }, c);
}

int distance(const coordinate& a, const coordinate& b) noexcept {
  return distance(to_cube(a), to_cube(b));
}

std::array<coordinate, direction_count> neighbors(const coordinate& c) noexcept {
  return std::visit(
      [](auto val) {
        std::array<coordinate, direction_count> res;
        for (size_t i = 0; i < direction_count; ++i)
          res[i] = step(val, i);
        return res;
      },
      c
  );
}

grid::result<coordinate> neighbor(const coordinate& c, int dir) noexcept {
  return std::visit(
      [dir](auto val) -> grid::result<coordinate> {
        const auto res = neighbor(val, dir);
        if (!res)
          return std::unexpected(res.error());
        return *res;
      },
      c
  );
}

grid::result<glm::vec3> to_world(const coordinate& c, cell_size_t size, const layout& l) {
  return to_world(to_axial(c), size, l);
}

std::string to_string(const coordinate& c) {
  return std::visit([](auto val) { return to_string(val); }, c);
}

std::string_view to_string(kind k) noexcept {
  switch (k) {
  case kind::cube: return "cube";
  case kind::axial: return "axial";
  case kind::odd_q: return "odd_q";
  case kind::even_q: return "even_q";
  case kind::doubled: return "doubled";
  }
  return "unknown";
}

} // namespace hex

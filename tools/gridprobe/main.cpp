#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>

#include <mp-units/systems/si.h>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <libs/cli/struct_args.hpp>
#include <libs/grid/errc.hpp>
#include <libs/grid/format.hpp>
#include <libs/hex/algorithms.hpp>
#include <libs/hex/bearing.hpp>
#include <libs/hex/coordinate.hpp>
#include <libs/hex/format.hpp>
#include <libs/hex/layout.hpp>
#include <libs/tri/algorithms.hpp>
#include <libs/tri/coordinate.hpp>
#include <libs/tri/format.hpp>
#include <libs/tri/index.hpp>
#include <libs/tri/layout.hpp>

#include "cells.hpp"
#include "parse_cell.hpp"

using namespace mp_units::si::unit_symbols;

struct opts {
  std::string_view grid =
      args::option<std::string_view>{"-g", "--grid", "tessellation to inspect: hex or tri"}.default_value("hex");
  std::string_view coord = args::option<std::string_view>{
      "-c", "--coord", "cell to inspect, \"a,b\" or \"x,y,z\" for cube coordinates"};
  std::string_view kind = args::option<std::string_view>{
      "-k", "--kind", "representation of a two value cell: axial, odd_q, even_q, doubled or offset"}
                              .default_value("axial");
  std::vector<std::string_view> targets = args::option<std::vector<std::string_view>>{
      "-t", "--target", "cell to measure distance, line and bearing to, repeatable"};
  std::string_view radius = args::option<std::string_view>{"-r", "--radius", "range and ring radius"}.default_value("1");
  std::string_view layout =
      args::option<std::string_view>{"-l", "--layout", "hex layout: pointy or flat"}.default_value("pointy");
  std::string_view size =
      args::option<std::string_view>{"-s", "--size", "cell radius or triangle edge in metres"}.default_value("1");
  const char* width =
      args::option<const char*>{"-w", "--width", "triangle storage width for row major index"}.default_value(nullptr);
};

namespace {

void setup_logger() {
  auto term = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(spdlog::color_mode::automatic);
  spdlog::default_logger()->sinks() = {term};
  spdlog::cfg::load_env_levels();
}

template <typename T>
T unwrap(std::string_view what, const grid::result<T>& res) {
  if (!res)
    throw std::system_error{make_error_code(res.error()), std::string{what}};
  return *res;
}

const hex::layout& hex_layout(std::string_view name) {
  if (name == "pointy")
    return hex::pointy_top;
  if (name == "flat")
    return hex::flat_top;
  bad_option("--layout", name, "expected pointy or flat");
}

void describe_hex(const opts& o, int radius, float size) {
  const hex::coordinate cell = hex_cell("--coord", o.coord, o.kind);
  const hex::layout& l = hex_layout(o.layout);
  const hex::cell_size_t cell_size = size * m;
  spdlog::debug("describing hex cell {} with radius {}", hex::to_string(cell), radius);

  for (auto k : {hex::kind::cube, hex::kind::axial, hex::kind::odd_q, hex::kind::even_q, hex::kind::doubled})
    fmt::print("{:>8}: {}\n", hex::to_string(k), hex::to_string(hex::convert(cell, k)));

  fmt::print("neighbors:");
  for (const hex::coordinate& n : hex::neighbors(cell))
    fmt::print(" {}", hex::to_string(n));
  fmt::print("\n");

  hex::cache_context ctx;
  const hex::axial center = hex::to_axial(cell);
  fmt::print("range({}): {} cells\n", radius, hex::range(center, radius, ctx).size());
  fmt::print("ring({}): {} cells\n", radius, hex::ring(center, radius).size());

  const glm::vec3 pos = unwrap("cell position", hex::to_world(cell, cell_size, l));
  fmt::print("center: ({:.4f}, {:.4f}) m\n", pos.x, pos.y);

  for (std::string_view text : o.targets) {
    const hex::axial target = hex::to_axial(hex_cell("--target", text, o.kind));
    fmt::print("target {}:\n", target);
    fmt::print("  distance: {}\n", hex::distance(center, target, ctx));
    fmt::print("  line: {}\n", fmt::join(hex::line(center, target), " "));
    const auto dist = unwrap("world distance", hex::world_distance(center, target, cell_size, l));
    fmt::print("  world distance: {:.4f} m\n", dist.numerical_value_in(m));
    const float bearing = hex::bearing_degrees(center, target, l);
    fmt::print("  bearing: {:.2f} deg ({})\n", bearing, hex::to_string(hex::compass_direction(bearing)));
  }
  spdlog::debug("cache hit rate {:.2f}", ctx.stats().hit_rate);
}

void describe_tri(const opts& o, int radius, float size) {
  const tri::coordinate cell = tri_cell("--coord", o.coord, o.kind);
  const tri::edge_length_t edge = size * m;
  spdlog::debug("describing triangle cell {} with radius {}", tri::to_string(cell), radius);

  for (auto k : {tri::kind::cube, tri::kind::axial, tri::kind::offset})
    fmt::print("{:>8}: {}\n", tri::to_string(k), tri::to_string(tri::convert(cell, k)));
  fmt::print("orientation: {}\n", tri::to_string(tri::orientation_of(cell)));

  fmt::print("edge neighbors:");
  for (const tri::coordinate& n : tri::neighbors(cell))
    fmt::print(" {}", tri::to_string(n));
  fmt::print("\n");

  const tri::axial center = tri::to_axial(cell);
  fmt::print("vertex neighbors: {}\n", fmt::join(tri::vertex_neighbors(center), " "));

  tri::cache_context ctx;
  fmt::print("range({}): {} cells\n", radius, tri::range(center, radius, ctx).size());
  fmt::print("ring({}): {} cells\n", radius, tri::ring(center, radius).size());

  const glm::vec3 pos = unwrap("cell position", tri::to_world(cell, edge));
  fmt::print("centroid: ({:.4f}, {:.4f}) m\n", pos.x, pos.y);

  if (o.width) {
    const int width = unwrap("--width", o.width, parse_int(o.width));
    const grid::result<int> index = tri::to_index(tri::convert<tri::offset>(center), width);
    if (index)
      fmt::print("index: {}\n", *index);
    else
      fmt::print("index: {}\n", index.error());
  }

  for (std::string_view text : o.targets) {
    const tri::axial target = tri::to_axial(tri_cell("--target", text, o.kind));
    fmt::print("target {}:\n", target);
    fmt::print("  distance: {}\n", tri::distance(center, target, ctx));
    fmt::print("  line: {}\n", fmt::join(tri::line(center, target), " "));
  }
}

} // namespace

int main(int argc, char** argv) try {
  setup_logger();
  std::span<char*> args{argv, static_cast<size_t>(argc)};
  if (get_flag(args, "-h")) {
    args::usage<opts>(std::filesystem::path{args.front()}.filename().string(), std::cout);
    args::args_help<opts>(std::cout);
    return EXIT_SUCCESS;
  }
  const auto opts = args::parse<::opts>(args);
  const int radius = unwrap("--radius", opts.radius, parse_int(opts.radius));
  const float size = unwrap("--size", opts.size, parse_float(opts.size));

  if (opts.grid == "hex")
    describe_hex(opts, radius, size);
  else if (opts.grid == "tri")
    describe_tri(opts, radius, size);
  else
    bad_option("--grid", opts.grid, "expected hex or tri");
  return EXIT_SUCCESS;
} catch (const std::system_error& err) {
  spdlog::error("{}", err.what());
  return EXIT_FAILURE;
}

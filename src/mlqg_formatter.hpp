#pragma once

// C/C++
#include <sstream>

// fmt
#include <fmt/format.h>
#include <fmt/ranges.h>

// mlqg
#include <mlqg/grid/grid.hpp>
#include <mlqg/params/params.hpp>
#include <mlqg/problem/problem.hpp>

template <>
struct fmt::formatter<mlqg::GridOptions> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const mlqg::GridOptions& p, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "(nx = {}; ny = {}; Lx = {}; Ly = {})",
                          p.nx(), p.ny(), p.Lx(), p.Ly());
  }
};

template <>
struct fmt::formatter<mlqg::ParamsOptions> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const mlqg::ParamsOptions& p, FormatContext& ctx) const {
    std::ostringstream flow;
    if (p.U().defined()) {
      flow << p.U().sizes();
    } else {
      flow << "none";
    }

    std::ostringstream topo;
    if (p.eta().defined()) {
      topo << p.eta().sizes();
    } else {
      topo << "none";
    }

    return fmt::format_to(
        ctx.out(),
        "(nlayers = {}; g = {}; f0 = {}; beta = {}; H = [{}]; rho = [{}]; "
        "U = {}; eta = {}; mu = {}; nu = {}; nnu = {}; forced = {})",
        p.nlayers(), p.g(), p.f0(), p.beta(), fmt::join(p.H(), ", "),
        fmt::join(p.rho(), ", "), flow.str(), topo.str(), p.mu(), p.nu(),
        p.nnu(), static_cast<bool>(p.calcFq()));
  }
};

template <>
struct fmt::formatter<mlqg::ProblemOptions> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const mlqg::ProblemOptions& p, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "grid = {}; layers = {}; dt = {}; linear = {}",
                          p.grid(), p.params(), p.dt(), p.linear());
  }
};

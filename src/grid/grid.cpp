// yaml
#include <yaml-cpp/yaml.h>

// fmt
#include <fmt/format.h>

// mlqg
#include "grid.hpp"

namespace mlqg {

GridOptions GridOptions::from_yaml(YAML::Node const& node) {
  GridOptions grid;

  if (node["nx"]) grid.nx(node["nx"].as<int>());
  grid.ny(node["ny"] ? node["ny"].as<int>() : grid.nx());

  if (node["Lx"]) grid.Lx(node["Lx"].as<double>());
  grid.Ly(node["Ly"] ? node["Ly"].as<double>() : grid.Lx());

  return grid;
}

GridImpl::GridImpl(GridOptions const& options_) : options(options_) {
  reset();
}

void GridImpl::reset() {
  TORCH_CHECK(options.nx() > 0 && options.ny() > 0,
              "grid needs at least one point in each direction, got nx = ",
              options.nx(), ", ny = ", options.ny());
  TORCH_CHECK(options.Lx() > 0. && options.Ly() > 0.,
              "domain extents must be positive, got Lx = ", options.Lx(),
              ", Ly = ", options.Ly());

  nx = options.nx();
  ny = options.ny();
  nkr = nx / 2 + 1;
  nl = ny;
  dx = options.Lx() / nx;
  dy = options.Ly() / ny;
  _shape = {ny, nx};

  auto opts = torch::TensorOptions().dtype(torch::kFloat64);

  x = register_buffer("x", -options.Lx() / 2. + dx * torch::arange(nx, opts));
  y = register_buffer("y", -options.Ly() / 2. + dy * torch::arange(ny, opts));

  kr = register_buffer(
      "kr", constants::two_pi * torch::fft::rfftfreq(nx, dx, opts).view({1, nkr}));
  l = register_buffer(
      "l", constants::two_pi * torch::fft::fftfreq(ny, dy, opts).view({nl, 1}));

  Krsq = register_buffer("Krsq", kr * kr + l * l);

  auto inv = 1. / Krsq;
  inv[0][0] = 0.;
  invKrsq = register_buffer("invKrsq", inv);
}

void GridImpl::pretty_print(std::ostream& os) const {
  os << fmt::format("Grid(nx = {}; ny = {}; Lx = {}; Ly = {}; nkr = {}; nl = {})",
                    nx, ny, options.Lx(), options.Ly(), nkr, nl);
}

void GridImpl::fwdtransform(torch::Tensor& varh,
                            torch::Tensor const& var) const {
  varh.copy_(torch::fft::rfft2(var));
}

void GridImpl::invtransform(torch::Tensor& var,
                            torch::Tensor const& varh) const {
  var.copy_(torch::fft::irfft2(varh, _shape));
}

torch::Tensor GridImpl::fwdtransform(torch::Tensor const& var) const {
  return torch::fft::rfft2(var);
}

torch::Tensor GridImpl::invtransform(torch::Tensor const& varh) const {
  return torch::fft::irfft2(varh, _shape);
}

torch::Tensor GridImpl::ddx(torch::Tensor const& fh) const {
  return c10::complex<double>(0., 1.) * kr * fh;
}

torch::Tensor GridImpl::ddy(torch::Tensor const& fh) const {
  return c10::complex<double>(0., 1.) * l * fh;
}

torch::Tensor GridImpl::parsevalsum(torch::Tensor const& fh) const {
  TORCH_CHECK(fh.size(-1) == nkr && fh.size(-2) == nl,
              "parsevalsum expects a half-complex spectrum of shape (..., ",
              nl, ", ", nkr, ")");

  // kr > 0 columns stand for their conjugate partners, except Nyquist
  int ndouble = (nx % 2 == 0) ? nkr - 2 : nkr - 1;

  auto total = fh.sum({-2, -1});
  if (ndouble > 0) {
    total = total + fh.narrow(-1, 1, ndouble).sum({-2, -1});
  }

  double norm = options.Lx() * options.Ly() /
                (static_cast<double>(nx) * nx * static_cast<double>(ny) * ny);
  if (total.is_complex()) total = torch::real(total);
  return total * norm;
}

torch::Tensor GridImpl::parsevalsum2(torch::Tensor const& fh) const {
  return parsevalsum(fh.abs().square());
}

}  // namespace mlqg

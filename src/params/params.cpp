// C/C++
#include <algorithm>
#include <cmath>
#include <numeric>

// torch
#include <torch/torch.h>

// yaml
#include <yaml-cpp/yaml.h>

// fmt
#include <fmt/format.h>
#include <fmt/ranges.h>

// mlqg
#include "params.hpp"

namespace mlqg {

ParamsOptions ParamsOptions::from_yaml(YAML::Node const& node) {
  ParamsOptions params;

  if (node["nlayers"]) params.nlayers(node["nlayers"].as<int>());
  if (node["g"]) params.g(node["g"].as<double>());
  if (node["f0"]) params.f0(node["f0"].as<double>());
  if (node["beta"]) params.beta(node["beta"].as<double>());

  if (node["H"]) params.H(node["H"].as<std::vector<double>>());
  if (node["rho"]) params.rho(node["rho"].as<std::vector<double>>());

  if (node["U"]) {
    auto const& u = node["U"];
    if (!u.IsSequence()) {
      params.U(torch::tensor(u.as<double>(), torch::kFloat64));
    } else if (u.size() > 0 && u[0].IsSequence()) {
      auto rows = u.as<std::vector<std::vector<double>>>();
      std::vector<double> flat;
      for (auto const& row : rows) {
        TORCH_CHECK(row.size() == rows[0].size(),
                    "every layer of 'U' needs the same number of points");
        flat.insert(flat.end(), row.begin(), row.end());
      }
      params.U(torch::tensor(flat, torch::kFloat64)
                   .view({(int64_t)rows.size(), (int64_t)rows[0].size()}));
    } else {
      params.U(torch::tensor(u.as<std::vector<double>>(), torch::kFloat64));
    }
  }

  if (node["mu"]) params.mu(node["mu"].as<double>());
  if (node["nu"]) params.nu(node["nu"].as<double>());
  if (node["nnu"]) params.nnu(node["nnu"].as<int>());

  return params;
}

torch::Tensor expand_zonal_flow(torch::Tensor U, int nlayers, int ny, int nx,
                                torch::TensorOptions const& opts) {
  if (!U.defined()) {
    return torch::zeros({nlayers, ny, nx}, opts);
  }

  U = U.to(opts);

  if (U.dim() == 0) {
    return U.expand({nlayers, ny, nx}).contiguous();
  }

  if (U.dim() == 1) {
    if (U.size(0) == nlayers) {
      return U.view({nlayers, 1, 1}).expand({nlayers, ny, nx}).contiguous();
    }
    TORCH_CHECK(nlayers == 1 && U.size(0) == ny,
                "a 1-D zonal flow needs one value per layer (", nlayers,
                "), got ", U.size(0));
    return U.view({1, ny, 1}).expand({1, ny, nx}).contiguous();
  }

  if (U.dim() == 2) {
    TORCH_CHECK(U.size(0) == nlayers && U.size(1) == ny,
                "a zonal flow U(y) must have shape (", nlayers, ", ", ny,
                "), got ", U.sizes());
    return U.view({nlayers, ny, 1}).expand({nlayers, ny, nx}).contiguous();
  }

  TORCH_CHECK(U.dim() == 3 && U.size(0) == nlayers && U.size(1) == ny &&
                  U.size(2) == nx,
              "a zonal flow U(x, y) must have shape (", nlayers, ", ", ny, ", ",
              nx, "), got ", U.sizes());
  return U.contiguous();
}

ParamsImpl::ParamsImpl(ParamsOptions const& options_, Grid grid_)
    : grid(grid_), options(options_) {
  reset();
}

void ParamsImpl::reset() {
  int nlayers = options.nlayers();
  TORCH_CHECK(nlayers >= 1, "nlayers must be at least 1, got ", nlayers);
  TORCH_CHECK(options.nnu() >= 1, "hyperviscous order must be at least 1, got ",
              options.nnu());

  grid = register_module("grid", grid);

  int nx = grid->nx, ny = grid->ny;
  auto opts = grid->Krsq.options();

  // imposed flow and its curvature, differentiated spectrally along y
  U = register_buffer("U", expand_zonal_flow(options.U(), nlayers, ny, nx, opts));

  auto lsq = grid->l.square();
  auto Uyy = torch::real(torch::fft::ifft(
      -lsq * torch::fft::fft(U, c10::nullopt, -2), c10::nullopt, -2));

  // topography acts on the bottom layer only
  if (options.eta().defined()) {
    TORCH_CHECK(options.eta().dim() == 2 && options.eta().size(0) == ny &&
                    options.eta().size(1) == nx,
                "topographic PV must have shape (", ny, ", ", nx, "), got ",
                options.eta().sizes());
    eta = register_buffer("eta", options.eta().to(opts).contiguous());
  } else {
    eta = register_buffer("eta", torch::zeros({ny, nx}, opts));
  }

  auto etah = grid->fwdtransform(eta);
  auto etax = grid->invtransform(grid->ddx(etah));
  auto etay = grid->invtransform(grid->ddy(etah));

  auto Qx_ = torch::zeros({nlayers, ny, nx}, opts);
  Qx_.select(0, nlayers - 1).add_(etax);

  auto Qy_ = options.beta() - Uyy;
  Qy_.select(0, nlayers - 1).add_(etay);

  StretchingOptions op_stretch;
  op_stretch.nlayers(nlayers);

  if (nlayers == 1) {
    H = register_buffer("H", torch::ones({1, 1, 1}, opts));
    rho = register_buffer("rho", torch::ones({1, 1, 1}, opts));
    gprime = register_buffer("gprime", torch::zeros({0}, opts));
  } else {
    auto const& h = options.H();
    auto const& r = options.rho();

    TORCH_CHECK(h.size() == nlayers, "expected ", nlayers,
                " layer thicknesses, got ", h.size());
    TORCH_CHECK(r.size() == nlayers, "expected ", nlayers,
                " layer densities, got ", r.size());
    TORCH_CHECK(options.g() > 0., "gravity must be positive, got ",
                options.g());

    for (int j = 0; j < nlayers; ++j) {
      TORCH_CHECK(h[j] > 0., "layer ", j, " has non-positive thickness ", h[j]);
    }
    for (int j = 0; j < nlayers - 1; ++j) {
      TORCH_CHECK(r[j] < r[j + 1], "density must increase downward, but rho[",
                  j, "] = ", r[j], " and rho[", j + 1, "] = ", r[j + 1]);
    }

    H = register_buffer(
        "H", torch::tensor(h, torch::kFloat64).view({nlayers, 1, 1}).to(opts));
    rho = register_buffer(
        "rho", torch::tensor(r, torch::kFloat64).view({nlayers, 1, 1}).to(opts));

    std::vector<double> gp(nlayers - 1), Fp(nlayers - 1), Fm(nlayers - 1);
    double f0sq = options.f0() * options.f0();

    for (int j = 0; j < nlayers - 1; ++j) {
      gp[j] = options.g() * (r[j + 1] - r[j]) / r[j + 1];
      Fp[j] = f0sq / (gp[j] * h[j]);
      Fm[j] = f0sq / (gp[j] * h[j + 1]);
    }

    gprime = register_buffer("gprime", torch::tensor(gp, torch::kFloat64).to(opts));

    // vertical shear of the imposed flow stretches the interfaces
    for (int j = 0; j < nlayers; ++j) {
      auto Qj = Qy_.select(0, j);
      if (j < nlayers - 1) {
        Qj.sub_(Fp[j] * (U.select(0, j + 1) - U.select(0, j)));
      }
      if (j > 0) {
        Qj.sub_(Fm[j - 1] * (U.select(0, j - 1) - U.select(0, j)));
      }
    }

    double Fmax = std::max(*std::max_element(Fp.begin(), Fp.end()),
                           *std::max_element(Fm.begin(), Fm.end()));
    double Ld = 1. / std::sqrt(Fmax);
    if (Ld < std::max(grid->dx, grid->dy)) {
      TORCH_WARN("smallest deformation radius ", Ld,
                 " is not resolved by the grid spacing (dx = ", grid->dx,
                 ", dy = ", grid->dy, ")");
    }

    op_stretch.Fp(Fp).Fm(Fm);
  }

  Qx = register_buffer("Qx", Qx_);
  Qy = register_buffer("Qy", Qy_.contiguous());

  stretching = register_module("stretching", Stretching(op_stretch, grid));
}

void ParamsImpl::pretty_print(std::ostream& os) const {
  os << fmt::format(
      "Params(nlayers = {}; f0 = {}; beta = {}; g = {}; mu = {}; nu = {}; "
      "nnu = {}; forced = {})",
      options.nlayers(), options.f0(), options.beta(), options.g(),
      options.mu(), options.nu(), options.nnu(),
      static_cast<bool>(options.calcFq()));
}

double ParamsImpl::total_depth() const { return H.sum().item<double>(); }

torch::Tensor ParamsImpl::interface_coupling() const {
  return options.f0() * options.f0() / gprime;
}

}  // namespace mlqg

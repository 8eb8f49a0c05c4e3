// torch
#include <torch/torch.h>

// fmt
#include <fmt/format.h>
#include <fmt/ranges.h>

// mlqg
#include "stretching.hpp"

namespace mlqg {

torch::Tensor coupling_matrix(std::vector<double> const& Fp,
                              std::vector<double> const& Fm) {
  TORCH_CHECK(Fp.size() == Fm.size(),
              "coupling coefficients size mismatch: Fp has ", Fp.size(),
              " entries, Fm has ", Fm.size());

  int n = Fp.size() + 1;
  std::vector<double> data(n * n, 0.);

  for (int j = 0; j < n - 1; ++j) {
    data[j * n + j + 1] = Fp[j];
    data[j * n + j] -= Fp[j];
    data[(j + 1) * n + j] = Fm[j];
    data[(j + 1) * n + j + 1] -= Fm[j];
  }

  return torch::tensor(data, torch::kFloat64).view({n, n});
}

void calc_stretching(torch::Tensor& S, torch::Tensor& invS,
                     std::vector<double> const& Fp,
                     std::vector<double> const& Fm, GridImpl const& grid) {
  int nlayers = Fp.size() + 1;
  auto opts = grid.Krsq.options();

  auto F = coupling_matrix(Fp, Fm).to(opts);
  auto eye = torch::eye(nlayers, opts);

  // (nl, nkr, 1, 1)
  auto ksq = grid.Krsq.unsqueeze(-1).unsqueeze(-1);

  S = -ksq * eye + F;

  auto ksq1 = torch::where(ksq == 0., torch::ones_like(ksq), ksq);
  invS = torch::linalg::inv(-ksq1 * eye + F);
  invS[0][0] = 0.;
}

torch::Tensor layer_matvec(torch::Tensor const& M, torch::Tensor const& xh) {
  auto yr = torch::einsum("lkij,jlkc->ilkc", {M, torch::view_as_real(xh)});
  return torch::view_as_complex(yr.contiguous());
}

StretchingImpl::StretchingImpl(StretchingOptions const& options_, Grid grid_)
    : grid(grid_), options(options_) {
  reset();
}

void StretchingImpl::reset() {
  TORCH_CHECK(options.nlayers() >= 1, "nlayers must be at least 1, got ",
              options.nlayers());
  TORCH_CHECK(options.Fp().size() == options.nlayers() - 1 &&
                  options.Fm().size() == options.nlayers() - 1,
              "a stack of ", options.nlayers(), " layers needs ",
              options.nlayers() - 1, " coupling coefficients per side");

  grid = register_module("grid", grid);

  F = register_buffer(
      "F", coupling_matrix(options.Fp(), options.Fm()).to(grid->Krsq.options()));

  // a single layer inverts with a scalar -1/k^2, no matrices
  if (options.nlayers() == 1) return;

  torch::Tensor S_, invS_;
  calc_stretching(S_, invS_, options.Fp(), options.Fm(), *grid);
  S = register_buffer("S", S_);
  invS = register_buffer("invS", invS_);
}

void StretchingImpl::pretty_print(std::ostream& os) const {
  os << fmt::format("Stretching(nlayers = {}; Fp = [{}]; Fm = [{}])",
                    options.nlayers(), fmt::join(options.Fp(), ", "),
                    fmt::join(options.Fm(), ", "));
}

void StretchingImpl::pv_from_streamfunction(torch::Tensor& qh,
                                            torch::Tensor const& psih) const {
  if (options.nlayers() == 1) {
    qh.copy_(-grid->Krsq * psih);
  } else {
    qh.copy_(layer_matvec(S, psih));
  }
}

void StretchingImpl::streamfunction_from_pv(torch::Tensor& psih,
                                            torch::Tensor const& qh) const {
  if (options.nlayers() == 1) {
    psih.copy_(-grid->invKrsq * qh);
  } else {
    psih.copy_(layer_matvec(invS, qh));
  }
}

}  // namespace mlqg

// torch
#include <torch/torch.h>

// mlqg
#include <mlqg/equation/equation.hpp>

#include "diagnostics.hpp"

namespace mlqg {

std::tuple<torch::Tensor, torch::Tensor> energies(Vars& vars,
                                                  ParamsImpl const& params,
                                                  GridImpl const& grid,
                                                  torch::Tensor const& sol) {
  int nlayers = params.nlayers();
  double norm = 1. / (2. * grid.options.Lx() * grid.options.Ly());

  vars.qh.copy_(sol);
  params.stretching->streamfunction_from_pv(vars.psih, vars.qh);

  auto ke = norm * grid.parsevalsum(grid.Krsq * vars.psih.abs().square());

  if (nlayers == 1) {
    return {ke.squeeze(0), torch::zeros({0}, ke.options())};
  }

  ke = ke * params.H.view({-1}) / params.total_depth();

  auto dpsih = vars.psih.narrow(0, 1, nlayers - 1) -
               vars.psih.narrow(0, 0, nlayers - 1);
  auto pe = norm * params.interface_coupling() * grid.parsevalsum2(dpsih);

  return {ke, pe};
}

std::tuple<torch::Tensor, torch::Tensor> fluxes(Vars& vars,
                                                ParamsImpl const& params,
                                                GridImpl const& grid,
                                                torch::Tensor const& sol) {
  int nlayers = params.nlayers();

  update_vars(vars, params, grid, sol);

  vars.uh.copy_(grid.ddy(vars.uh));
  grid.invtransform(vars.u, vars.uh);  // du/dy

  double norm = grid.dx * grid.dy /
                (grid.options.Lx() * grid.options.Ly() * params.total_depth());

  auto lateral =
      (params.H * params.U * vars.v * vars.u).sum({-2, -1}) * norm;

  auto shear = params.U.narrow(0, 0, nlayers - 1) -
               params.U.narrow(0, 1, nlayers - 1);
  auto vertical = (params.interface_coupling().view({nlayers - 1, 1, 1}) * shear *
                   vars.v.narrow(0, 1, nlayers - 1) *
                   vars.psi.narrow(0, 0, nlayers - 1))
                      .sum({-2, -1}) *
                  norm;

  return {lateral, vertical};
}

}  // namespace mlqg

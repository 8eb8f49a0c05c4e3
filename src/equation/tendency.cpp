// torch
#include <torch/torch.h>

// mlqg
#include "equation.hpp"

namespace mlqg {

void update_vars(Vars& vars, ParamsImpl const& params, GridImpl const& grid,
                 torch::Tensor const& sol) {
  vars.qh.copy_(sol);
  params.stretching->streamfunction_from_pv(vars.psih, vars.qh);

  vars.uh.copy_(-grid.ddy(vars.psih));
  vars.vh.copy_(grid.ddx(vars.psih));

  grid.invtransform(vars.q, vars.qh);
  grid.invtransform(vars.psi, vars.psih);
  grid.invtransform(vars.u, vars.uh);
  grid.invtransform(vars.v, vars.vh);
}

void calc_advection(torch::Tensor& N, torch::Tensor const& sol, Vars& vars,
                    ParamsImpl const& params, GridImpl const& grid) {
  vars.qh.copy_(sol);

  params.stretching->streamfunction_from_pv(vars.psih, vars.qh);

  vars.uh.copy_(-grid.ddy(vars.psih));
  vars.vh.copy_(grid.ddx(vars.psih));

  grid.invtransform(vars.u, vars.uh);
  vars.u.add_(params.U);
  grid.fwdtransform(vars.uh, vars.u * params.Qx);
  N.copy_(-vars.uh);  // -(U+u)*dQ/dx

  grid.invtransform(vars.v, vars.vh);
  grid.fwdtransform(vars.vh, vars.v * params.Qy);
  N.sub_(vars.vh);  // -v*dQ/dy

  grid.invtransform(vars.q, vars.qh);

  vars.u.mul_(vars.q);  // (U+u)*q
  vars.v.mul_(vars.q);  // v*q

  grid.fwdtransform(vars.uh, vars.u);
  grid.fwdtransform(vars.vh, vars.v);

  N.sub_(grid.ddx(vars.uh) + grid.ddy(vars.vh));
}

void calc_linear_advection(torch::Tensor& N, torch::Tensor const& sol,
                           Vars& vars, ParamsImpl const& params,
                           GridImpl const& grid) {
  vars.qh.copy_(sol);

  params.stretching->streamfunction_from_pv(vars.psih, vars.qh);

  vars.uh.copy_(-grid.ddy(vars.psih));
  vars.vh.copy_(grid.ddx(vars.psih));

  grid.invtransform(vars.u, vars.uh);
  vars.u.add_(params.U);
  grid.fwdtransform(vars.uh, vars.u * params.Qx);
  N.copy_(-vars.uh);  // -(U+u)*dQ/dx

  grid.invtransform(vars.v, vars.vh);
  grid.fwdtransform(vars.vh, vars.v * params.Qy);
  N.sub_(vars.vh);  // -v*dQ/dy

  grid.invtransform(vars.q, vars.qh);
  vars.u.copy_(params.U * vars.q);  // U*q

  grid.fwdtransform(vars.uh, vars.u);

  N.sub_(grid.ddx(vars.uh));
}

void add_bottom_drag(torch::Tensor& N, Vars const& vars,
                     ParamsImpl const& params, GridImpl const& grid) {
  int bottom = params.nlayers() - 1;
  N.select(0, bottom)
      .add_(params.options.mu() * grid.Krsq * vars.psih.select(0, bottom));
}

void add_forcing(torch::Tensor& N, torch::Tensor const& sol, double t,
                 Clock const& clock, Vars& vars, ParamsImpl const& params,
                 GridImpl const& grid) {
  if (!vars.forced()) return;

  TORCH_CHECK(params.options.calcFq(),
              "forcing buffer allocated but no forcing function was given");

  params.options.calcFq()(vars.Fqh, sol, t, clock, vars, params, grid);
  N.add_(vars.Fqh);
}

void calc_tendency(torch::Tensor& N, torch::Tensor const& sol, double t,
                   Clock const& clock, Vars& vars, ParamsImpl const& params,
                   GridImpl const& grid) {
  calc_advection(N, sol, vars, params, grid);
  add_bottom_drag(N, vars, params, grid);
  add_forcing(N, sol, t, clock, vars, params, grid);
}

void calc_linear_tendency(torch::Tensor& N, torch::Tensor const& sol, double t,
                          Clock const& clock, Vars& vars,
                          ParamsImpl const& params, GridImpl const& grid) {
  calc_linear_advection(N, sol, vars, params, grid);
  add_bottom_drag(N, vars, params, grid);
  add_forcing(N, sol, t, clock, vars, params, grid);
}

}  // namespace mlqg

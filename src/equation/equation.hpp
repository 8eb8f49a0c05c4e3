#pragma once

// C/C++
#include <functional>

// mlqg
#include <mlqg/grid/grid.hpp>
#include <mlqg/params/params.hpp>
#include <mlqg/vars/vars.hpp>

#include "forcing.hpp"

namespace mlqg {

//! signature shared by the nonlinear and the linearized tendency
using tendency_func = std::function<void(
    torch::Tensor& N, torch::Tensor const& sol, double t, Clock const& clock,
    Vars& vars, ParamsImpl const& params, GridImpl const& grid)>;

//! \brief Advection of PV by the full flow
/*!
 * N = -(U + u) dQ/dx - v dQ/dy - d[(U + u) q]/dx - d[v q]/dy
 *
 * Products are formed on the grid and transformed back, derivatives are
 * taken spectrally. `sol` is copied into vars.qh and never written; every
 * other field of `vars` is overwritten.
 *
 * \param[out] N tendency, shape (nlayers, nl, nkr)
 * \param[in] sol spectral PV, shape (nlayers, nl, nkr)
 */
void calc_advection(torch::Tensor& N, torch::Tensor const& sol, Vars& vars,
                    ParamsImpl const& params, GridImpl const& grid);

//! \brief Advection linearized about the imposed flow
/*!
 * N = -(U + u) dQ/dx - v dQ/dy - d[U q]/dx
 */
void calc_linear_advection(torch::Tensor& N, torch::Tensor const& sol,
                           Vars& vars, ParamsImpl const& params,
                           GridImpl const& grid);

//! N += mu k^2 psih in the bottom layer, psih taken from vars
void add_bottom_drag(torch::Tensor& N, Vars const& vars,
                     ParamsImpl const& params, GridImpl const& grid);

//! N += Fqh after the forcing callback filled it; no-op when unforced
void add_forcing(torch::Tensor& N, torch::Tensor const& sol, double t,
                 Clock const& clock, Vars& vars, ParamsImpl const& params,
                 GridImpl const& grid);

//! full nonlinear right-hand side
void calc_tendency(torch::Tensor& N, torch::Tensor const& sol, double t,
                   Clock const& clock, Vars& vars, ParamsImpl const& params,
                   GridImpl const& grid);

//! linearized right-hand side
void calc_linear_tendency(torch::Tensor& N, torch::Tensor const& sol, double t,
                          Clock const& clock, Vars& vars,
                          ParamsImpl const& params, GridImpl const& grid);

//! \brief Refresh every field of `vars` from the spectral PV
/*!
 * Leaves q, psi, u, v and their spectra consistent with `sol`, which is
 * only read.
 */
void update_vars(Vars& vars, ParamsImpl const& params, GridImpl const& grid,
                 torch::Tensor const& sol);

//! \brief Hyperviscous linear operator -nu k^(2 nnu), zero at the origin
/*!
 * \return L, shape (nlayers, nl, nkr)
 */
torch::Tensor hyperdissipation(ParamsImpl const& params, GridImpl const& grid);

//! Linear operator and tendency handed to a time integrator
struct Equation {
  //! diagonal linear coefficient, shape (nlayers, nl, nkr)
  torch::Tensor L;

  //! nonlinear part of the right-hand side
  tendency_func calcN;

  bool linear = false;

  Equation() = default;
  Equation(ParamsImpl const& params, GridImpl const& grid, bool linear_);
};

}  // namespace mlqg

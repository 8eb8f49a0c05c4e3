#pragma once

// C/C++
#include <tuple>

// mlqg
#include <mlqg/grid/grid.hpp>
#include <mlqg/params/params.hpp>
#include <mlqg/vars/vars.hpp>

namespace mlqg {

//! \brief Kinetic energy of each layer and potential energy of each interface
/*!
 * KE_j = 1/(2 Lx Ly) sum_k k^2 |psih_j|^2 H_j / sum(H)
 * PE_j = 1/(2 Lx Ly) f0^2 / g'_j sum_k |psih_{j+1} - psih_j|^2
 *
 * psih is recomputed from `sol` first; vars.qh and vars.psih are
 * overwritten.
 *
 * \return (KE, PE) with shapes (nlayers,) and (nlayers - 1,); a single layer
 *         gives a 0-dim KE and an empty PE
 */
std::tuple<torch::Tensor, torch::Tensor> energies(Vars& vars,
                                                  ParamsImpl const& params,
                                                  GridImpl const& grid,
                                                  torch::Tensor const& sol);

//! \brief Lateral eddy flux of each layer and vertical eddy flux of each
//! interface
/*!
 * lateral_j  = <H_j U_j v_j du_j/dy> / sum(H)
 * vertical_j = <f0^2 / g'_j (U_j - U_{j+1}) v_{j+1} psi_j> / sum(H)
 *
 * where <.> is the domain average. All fields are refreshed from `sol`
 * first, after which vars.u and vars.uh hold du/dy.
 *
 * \return (lateral, vertical) with shapes (nlayers,) and (nlayers - 1,)
 */
std::tuple<torch::Tensor, torch::Tensor> fluxes(Vars& vars,
                                                ParamsImpl const& params,
                                                GridImpl const& grid,
                                                torch::Tensor const& sol);

}  // namespace mlqg

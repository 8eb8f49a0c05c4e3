#pragma once

// torch
#include <torch/types.h>

// mlqg
#include <mlqg/grid/grid.hpp>

namespace mlqg {

//! \brief Physical and spectral fields of a problem
/*!
 * Real fields have shape (nlayers, ny, nx), spectra (nlayers, nl, nkr).
 * Every field is scratch for the tendency and the diagnostics; only
 * `update_vars` leaves them consistent with the solution.
 */
struct Vars {
  torch::Tensor q, psi, u, v;
  torch::Tensor qh, psih, uh, vh;

  //! forcing spectrum, undefined unless the problem is forced
  torch::Tensor Fqh;

  Vars() = default;

  //! allocate zero fields on the grid's device and real dtype
  Vars(GridImpl const& grid, int nlayers, bool forced = false);

  bool forced() const { return Fqh.defined(); }
  int nlayers() const { return q.defined() ? q.size(0) : 0; }
};

}  // namespace mlqg

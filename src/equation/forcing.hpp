#pragma once

// C/C++
#include <cstdint>
#include <functional>

// torch
#include <torch/types.h>

namespace mlqg {

class GridImpl;
class ParamsImpl;
struct Vars;

//! time bookkeeping handed through to forcing callbacks
struct Clock {
  double t = 0.;
  double dt = 0.01;
  int64_t step = 0;
};

//! \brief Forcing hook of a forced problem
/*!
 * Writes the forcing spectrum into Fqh, shape (nlayers, nl, nkr), given the
 * current spectral PV sol. Anything it throws reaches the caller of the
 * tendency unchanged.
 */
using forcing_func = std::function<void(
    torch::Tensor Fqh, torch::Tensor const& sol, double t, Clock const& clock,
    Vars& vars, ParamsImpl const& params, GridImpl const& grid)>;

}  // namespace mlqg

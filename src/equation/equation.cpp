// torch
#include <torch/torch.h>

// mlqg
#include "equation.hpp"

namespace mlqg {

torch::Tensor hyperdissipation(ParamsImpl const& params, GridImpl const& grid) {
  auto L = -params.options.nu() * grid.Krsq.pow(params.options.nnu());
  L = L.unsqueeze(0).repeat({params.nlayers(), 1, 1});
  L.select(-1, 0).select(-1, 0).zero_();
  return L;
}

Equation::Equation(ParamsImpl const& params, GridImpl const& grid,
                   bool linear_)
    : linear(linear_) {
  L = hyperdissipation(params, grid);
  if (linear) {
    calcN = calc_linear_tendency;
  } else {
    calcN = calc_tendency;
  }
}

}  // namespace mlqg

// torch
#include <torch/torch.h>

// mlqg
#include "vars.hpp"

namespace mlqg {

Vars::Vars(GridImpl const& grid, int nlayers, bool forced) {
  TORCH_CHECK(nlayers >= 1, "nlayers must be at least 1, got ", nlayers);

  auto ropts = grid.Krsq.options();
  auto copts = ropts.dtype(
      c10::toComplexType(c10::typeMetaToScalarType(ropts.dtype())));

  q = torch::zeros({nlayers, grid.ny, grid.nx}, ropts);
  psi = torch::zeros_like(q);
  u = torch::zeros_like(q);
  v = torch::zeros_like(q);

  qh = torch::zeros({nlayers, grid.nl, grid.nkr}, copts);
  psih = torch::zeros_like(qh);
  uh = torch::zeros_like(qh);
  vh = torch::zeros_like(qh);

  if (forced) Fqh = torch::zeros_like(qh);
}

}  // namespace mlqg

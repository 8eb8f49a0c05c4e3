#pragma once

// C/C++
#include <vector>

// torch
#include <torch/nn/cloneable.h>
#include <torch/nn/module.h>
#include <torch/nn/modules/common.h>

// mlqg
#include <mlqg/equation/forcing.hpp>
#include <mlqg/grid/grid.hpp>
#include <mlqg/stretching/stretching.hpp>

// arg
#include <mlqg/add_arg.h>

namespace YAML {
class Node;
}

namespace mlqg {

struct ParamsOptions {
  //! \brief Create a `ParamsOptions` object from the `layers` section of a
  //! YAML document
  /*!
   * Recognized keys: nlayers, g, f0, beta, H, rho, U, mu, nu, nnu.
   * `U` is either one value per layer or one list of ny values per layer.
   */
  static ParamsOptions from_yaml(YAML::Node const& node);

  ParamsOptions() = default;

  //! number of fluid layers, top to bottom
  ADD_ARG(int, nlayers) = 2;

  //! gravitational acceleration
  ADD_ARG(double, g) = 1.0;

  //! Coriolis parameter
  ADD_ARG(double, f0) = 1.0;

  //! y-gradient of the Coriolis parameter
  ADD_ARG(double, beta) = 0.0;

  //! rest thickness of each layer, ignored for a single layer
  ADD_ARG(std::vector<double>, H) = {0.2, 0.8};

  //! density of each layer, ignored for a single layer
  ADD_ARG(std::vector<double>, rho) = {4.0, 5.0};

  //! imposed zonal flow, shape (), (nlayers,), (nlayers, ny) or
  //! (nlayers, ny, nx). Undefined means no imposed flow.
  ADD_ARG(torch::Tensor, U);

  //! topographic PV, shape (ny, nx). Undefined means a flat bottom.
  ADD_ARG(torch::Tensor, eta);

  //! linear bottom drag
  ADD_ARG(double, mu) = 0.0;

  //! (hyper)viscosity coefficient and order
  ADD_ARG(double, nu) = 0.0;
  ADD_ARG(int, nnu) = 1;

  //! forcing on the PV, empty for an unforced problem
  ADD_ARG(forcing_func, calcFq) = nullptr;
};

//! \brief Broadcast an imposed zonal flow to (nlayers, ny, nx)
/*!
 * \param U scalar, (nlayers,), (nlayers, ny) or (nlayers, ny, nx); a
 *          single layer also accepts a (ny,) profile
 * \return contiguous flow, on the device and dtype of `opts`
 */
torch::Tensor expand_zonal_flow(torch::Tensor U, int nlayers, int ny, int nx,
                                torch::TensorOptions const& opts);

//! Layer structure and background PV gradients
class ParamsImpl : public torch::nn::Cloneable<ParamsImpl> {
 public:
  //! rest thickness, shape (nlayers, 1, 1)
  torch::Tensor H;

  //! density, shape (nlayers, 1, 1)
  torch::Tensor rho;

  //! imposed zonal flow, shape (nlayers, ny, nx)
  torch::Tensor U;

  //! topographic PV, shape (ny, nx)
  torch::Tensor eta;

  //! reduced gravity at each interface, shape (nlayers - 1,)
  torch::Tensor gprime;

  //! background PV gradients, shape (nlayers, ny, nx)
  torch::Tensor Qx, Qy;

  //! wavenumbers and transforms
  Grid grid = nullptr;

  //! PV inversion
  Stretching stretching = nullptr;

  //! options with which this `Params` was constructed
  ParamsOptions options;

  ParamsImpl() = default;
  ParamsImpl(ParamsOptions const& options_, Grid grid_);
  void reset() override;
  void pretty_print(std::ostream& os) const override;

  int nlayers() const { return options.nlayers(); }

  //! sum of the layer thicknesses
  double total_depth() const;

  //! f0^2 / g' at each interface, shape (nlayers - 1,)
  torch::Tensor interface_coupling() const;
};
TORCH_MODULE(Params);

}  // namespace mlqg

#undef ADD_ARG

#pragma once

// C/C++
#include <memory>
#include <string>
#include <tuple>

// torch
#include <torch/nn/cloneable.h>
#include <torch/nn/module.h>
#include <torch/nn/modules/common.h>

// mlqg
#include <mlqg/equation/equation.hpp>
#include <mlqg/grid/grid.hpp>
#include <mlqg/params/params.hpp>
#include <mlqg/vars/vars.hpp>

// arg
#include <mlqg/add_arg.h>

namespace mlqg {

struct ProblemOptions {
  //! \brief Create a `ProblemOptions` object from a YAML file
  /*!
   * The file must contain a `grid` section and a `layers` section, see
   * `GridOptions::from_yaml` and `ParamsOptions::from_yaml`. An optional
   * `problem` section sets `dt` and `linear`.
   */
  static ProblemOptions from_yaml(std::string const& filename);

  ProblemOptions() = default;

  ADD_ARG(GridOptions, grid);
  ADD_ARG(ParamsOptions, params);

  //! time step reported to forcing callbacks through the clock
  ADD_ARG(double, dt) = 0.01;

  //! evolve the equations linearized about the imposed flow
  ADD_ARG(bool, linear) = false;
};

//! \brief Multi-layer quasi-geostrophic problem
/*!
 * `sol` holds the spectral PV and is the only authoritative state; every
 * field of `vars` is derived from it and may be overwritten by any call.
 * One problem must not evaluate two tendencies at the same time, since
 * they share `vars` as scratch.
 */
class ProblemImpl : public torch::nn::Cloneable<ProblemImpl> {
 public:
  Grid grid = nullptr;
  Params params = nullptr;
  Vars vars;
  Equation eqn;

  //! spectral PV, shape (nlayers, nl, nkr)
  torch::Tensor sol;

  Clock clock;

  //! options with which this `Problem` was constructed
  ProblemOptions options;

  ProblemImpl() = default;

  //! \param options_ problem options
  //! \param tensor_options device and real dtype of every field
  explicit ProblemImpl(ProblemOptions const& options_,
                       torch::TensorOptions const& tensor_options =
                           torch::TensorOptions().dtype(torch::kFloat64));
  void reset() override;
  void pretty_print(std::ostream& os) const override;

  int nlayers() const { return params->nlayers(); }

  //! \brief Copy of the problem that carries `sol` and `clock` along
  /*!
   * The default module clone rebuilds every field in `reset()`, which would
   * leave the copy at rest.
   */
  std::shared_ptr<torch::nn::Module> clone(
      torch::optional<torch::Device> const& device =
          torch::nullopt) const override;

  //! \brief Right-hand side at the current clock time
  /*!
   * \param[out] N tendency, shape (nlayers, nl, nkr); must not alias `vars`
   * \param[in] sol spectral PV
   */
  void tendency(torch::Tensor& N, torch::Tensor const& sol);

  //! \brief Right-hand side at time `t`
  /*!
   * Entry point for integrators evaluating stages between clock ticks;
   * `clock` is passed through to the forcing but not modified.
   */
  void tendency(torch::Tensor& N, torch::Tensor const& sol, double t);

  //! \brief Right-hand side at the current clock time
  torch::Tensor forward(torch::Tensor sol);

  //! recompute q, psi, u, v from `sol`
  void update_vars();

  //! \brief Set the solution from a physical PV field
  /*!
   * The domain mean of each layer is removed.
   * \param q PV, shape (nlayers, ny, nx)
   */
  void set_q(torch::Tensor const& q);

  //! \brief Set the solution to the PV of a physical streamfunction
  /*!
   * \param psi streamfunction, shape (nlayers, ny, nx)
   */
  void set_psi(torch::Tensor const& psi);

  //! (KE, PE) of the current solution
  std::tuple<torch::Tensor, torch::Tensor> energies();

  //! (lateral, vertical) eddy fluxes of the current solution
  std::tuple<torch::Tensor, torch::Tensor> fluxes();

 private:
  torch::TensorOptions _tensor_options;

  void _check_field(torch::Tensor const& f, char const* name) const;
};
TORCH_MODULE(Problem);

}  // namespace mlqg

#undef ADD_ARG

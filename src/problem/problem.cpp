// torch
#include <torch/torch.h>

// yaml
#include <yaml-cpp/yaml.h>

// fmt
#include <fmt/format.h>

// mlqg
#include <mlqg/diagnostics/diagnostics.hpp>
#include <mlqg/mlqg_formatter.hpp>

#include "problem.hpp"

namespace mlqg {

ProblemOptions ProblemOptions::from_yaml(std::string const& filename) {
  ProblemOptions problem;
  auto config = YAML::LoadFile(filename);

  TORCH_CHECK(config["grid"],
              "'grid' is not defined in the configuration file ", filename);
  TORCH_CHECK(config["layers"],
              "'layers' is not defined in the configuration file ", filename);

  problem.grid(GridOptions::from_yaml(config["grid"]));
  problem.params(ParamsOptions::from_yaml(config["layers"]));

  if (config["problem"]) {
    auto const& node = config["problem"];
    if (node["dt"]) problem.dt(node["dt"].as<double>());
    if (node["linear"]) problem.linear(node["linear"].as<bool>());
  }

  return problem;
}

ProblemImpl::ProblemImpl(ProblemOptions const& options_,
                         torch::TensorOptions const& tensor_options)
    : options(options_), _tensor_options(tensor_options) {
  reset();
}

void ProblemImpl::reset() {
  auto grid_ = Grid(options.grid());
  grid_->to(_tensor_options.device(),
            c10::typeMetaToScalarType(_tensor_options.dtype()));
  grid = register_module("grid", grid_);

  params = register_module("params", Params(options.params(), grid));

  bool forced = static_cast<bool>(options.params().calcFq());
  vars = Vars(*grid, params->nlayers(), forced);
  eqn = Equation(*params, *grid, options.linear());

  sol = torch::zeros_like(vars.qh);

  clock = Clock();
  clock.dt = options.dt();
}

void ProblemImpl::pretty_print(std::ostream& os) const {
  os << fmt::format("Problem({})", options);
}

std::shared_ptr<torch::nn::Module> ProblemImpl::clone(
    torch::optional<torch::Device> const& device) const {
  auto copy = std::dynamic_pointer_cast<ProblemImpl>(
      torch::nn::Cloneable<ProblemImpl>::clone(device));
  TORCH_CHECK(copy, "cloning a Problem did not produce a Problem");

  // fields outside the module tree follow the cloned grid
  if (device.has_value()) {
    copy->_tensor_options = copy->_tensor_options.device(*device);
    copy->vars = Vars(*copy->grid, copy->nlayers(), copy->vars.forced());
    copy->eqn = Equation(*copy->params, *copy->grid, copy->options.linear());
    copy->sol = torch::zeros_like(copy->vars.qh);
  }

  copy->sol.copy_(sol);
  copy->clock = clock;
  copy->update_vars();
  return copy;
}

void ProblemImpl::tendency(torch::Tensor& N, torch::Tensor const& sol_) {
  tendency(N, sol_, clock.t);
}

void ProblemImpl::tendency(torch::Tensor& N, torch::Tensor const& sol_,
                           double t) {
  eqn.calcN(N, sol_, t, clock, vars, *params, *grid);
}

torch::Tensor ProblemImpl::forward(torch::Tensor sol_) {
  auto N = torch::zeros_like(sol_);
  tendency(N, sol_);
  return N;
}

void ProblemImpl::update_vars() { mlqg::update_vars(vars, *params, *grid, sol); }

void ProblemImpl::set_q(torch::Tensor const& q) {
  _check_field(q, "q");

  grid->fwdtransform(vars.qh, q.to(vars.q.options()));
  vars.qh.select(-1, 0).select(-1, 0).zero_();
  sol.copy_(vars.qh);

  update_vars();
}

void ProblemImpl::set_psi(torch::Tensor const& psi) {
  _check_field(psi, "psi");

  grid->fwdtransform(vars.psih, psi.to(vars.psi.options()));
  params->stretching->pv_from_streamfunction(vars.qh, vars.psih);
  grid->invtransform(vars.q, vars.qh);

  set_q(vars.q);
}

std::tuple<torch::Tensor, torch::Tensor> ProblemImpl::energies() {
  return mlqg::energies(vars, *params, *grid, sol);
}

std::tuple<torch::Tensor, torch::Tensor> ProblemImpl::fluxes() {
  return mlqg::fluxes(vars, *params, *grid, sol);
}

void ProblemImpl::_check_field(torch::Tensor const& f, char const* name) const {
  TORCH_CHECK(f.dim() == 3 && f.size(0) == nlayers() && f.size(1) == grid->ny &&
                  f.size(2) == grid->nx,
              name, " must have shape (", nlayers(), ", ", grid->ny, ", ",
              grid->nx, "), got ", f.sizes());
}

}  // namespace mlqg

#pragma once

// C/C++
#include <vector>

// torch
#include <torch/nn/cloneable.h>
#include <torch/nn/module.h>
#include <torch/nn/modules/common.h>

// mlqg
#include <mlqg/constants.h>

// arg
#include <mlqg/add_arg.h>

namespace YAML {
class Node;
}

namespace mlqg {

struct GridOptions {
  //! \brief Create a `GridOptions` object from the `grid` section of a
  //! YAML document. Missing `ny` and `Ly` copy `nx` and `Lx`.
  static GridOptions from_yaml(YAML::Node const& node);

  GridOptions() = default;

  ADD_ARG(int, nx) = 128;
  ADD_ARG(int, ny) = 128;
  ADD_ARG(double, Lx) = constants::two_pi;
  ADD_ARG(double, Ly) = constants::two_pi;
};

//! Doubly periodic grid and its real Fourier transforms
/*!
 * Physical fields are laid out (..., ny, nx) and their half-complex spectra
 * (..., nl, nkr) with nl = ny and nkr = nx / 2 + 1.
 */
class GridImpl : public torch::nn::Cloneable<GridImpl> {
 public:
  int nx = 0, ny = 0;
  int nkr = 0, nl = 0;
  double dx = 0., dy = 0.;

  //! grid points, shape (nx,) and (ny,)
  torch::Tensor x, y;

  //! zonal wavenumber, shape (1, nkr)
  torch::Tensor kr;

  //! meridional wavenumber, shape (nl, 1)
  torch::Tensor l;

  //! kr^2 + l^2 and its inverse (zero at the origin), shape (nl, nkr)
  torch::Tensor Krsq, invKrsq;

  //! options with which this `Grid` was constructed
  GridOptions options;

  GridImpl() = default;
  explicit GridImpl(GridOptions const& options_);
  void reset() override;
  void pretty_print(std::ostream& os) const override;

  //! \brief Forward real transform over the two trailing axes
  /*!
   * \param[out] varh spectrum, shape (..., nl, nkr)
   * \param[in] var physical field, shape (..., ny, nx)
   */
  void fwdtransform(torch::Tensor& varh, torch::Tensor const& var) const;

  //! \brief Inverse real transform over the two trailing axes
  /*!
   * The input spectrum is left untouched.
   * \param[out] var physical field, shape (..., ny, nx)
   * \param[in] varh spectrum, shape (..., nl, nkr)
   */
  void invtransform(torch::Tensor& var, torch::Tensor const& varh) const;

  torch::Tensor fwdtransform(torch::Tensor const& var) const;
  torch::Tensor invtransform(torch::Tensor const& varh) const;

  //! i * kr * fh
  torch::Tensor ddx(torch::Tensor const& fh) const;

  //! i * l * fh
  torch::Tensor ddy(torch::Tensor const& fh) const;

  //! \brief Domain integral from a half-complex spectrum
  /*!
   * Sums fh over the half spectrum, counting every kr > 0 column twice
   * except the Nyquist column of an even nx, and scales by
   * Lx * Ly / (nx^2 * ny^2).
   *
   * \param fh spectrum, shape (..., nl, nkr)
   * \return real part of the sum, shape (...)
   */
  torch::Tensor parsevalsum(torch::Tensor const& fh) const;

  //! \brief Domain integral of f^2 given the spectrum of f
  torch::Tensor parsevalsum2(torch::Tensor const& fh) const;

 private:
  std::vector<int64_t> _shape;
};
TORCH_MODULE(Grid);

}  // namespace mlqg

#undef ADD_ARG

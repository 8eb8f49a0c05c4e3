#pragma once

// C/C++
#include <vector>

// torch
#include <torch/nn/cloneable.h>
#include <torch/nn/module.h>
#include <torch/nn/modules/common.h>

// mlqg
#include <mlqg/grid/grid.hpp>

// arg
#include <mlqg/add_arg.h>

namespace mlqg {

//! \brief Tridiagonal layer coupling matrix
/*!
 * Row j holds Fm[j-1], -(Fp[j] + Fm[j-1]), Fp[j] on the sub-, main and
 * super-diagonal, with the out-of-range coefficients taken as zero.
 *
 * \param Fp super-diagonal, (nlayers - 1,)
 * \param Fm sub-diagonal, (nlayers - 1,)
 * \return F, shape (nlayers, nlayers), float64
 */
torch::Tensor coupling_matrix(std::vector<double> const& Fp,
                              std::vector<double> const& Fm);

//! \brief Build the stretching matrix and its inverse at every wavenumber
/*!
 * S = -k^2 I + F. The inverse is taken with k^2 = 1 at the origin and then
 * zeroed there, so the domain mean of q never feeds back into psi.
 *
 * \param[out] S q from psi, shape (nl, nkr, nlayers, nlayers)
 * \param[out] invS psi from q, shape (nl, nkr, nlayers, nlayers)
 * \param Fp super-diagonal coupling, (nlayers - 1,)
 * \param Fm sub-diagonal coupling, (nlayers - 1,)
 * \param grid wavenumbers
 */
void calc_stretching(torch::Tensor& S, torch::Tensor& invS,
                     std::vector<double> const& Fp,
                     std::vector<double> const& Fm, GridImpl const& grid);

//! \brief Apply a real per-wavenumber matrix to a layered spectrum
/*!
 * \param M shape (nl, nkr, nlayers, nlayers)
 * \param xh shape (nlayers, nl, nkr), complex
 * \return M * xh at every wavenumber, shape (nlayers, nl, nkr)
 */
torch::Tensor layer_matvec(torch::Tensor const& M, torch::Tensor const& xh);

struct StretchingOptions {
  StretchingOptions() = default;

  ADD_ARG(int, nlayers) = 1;

  //! f0^2 / (g'_j H_j), couples layer j to the layer below
  ADD_ARG(std::vector<double>, Fp) = {};

  //! f0^2 / (g'_j H_{j+1}), couples layer j + 1 to the layer above
  ADD_ARG(std::vector<double>, Fm) = {};
};

//! PV inversion coupling the layers at each horizontal wavenumber
class StretchingImpl : public torch::nn::Cloneable<StretchingImpl> {
 public:
  //! layer coupling matrix, shape (nlayers, nlayers)
  torch::Tensor F;

  //! stretching matrix and its inverse, shape (nl, nkr, nlayers, nlayers)
  //! undefined for a single layer
  torch::Tensor S, invS;

  //! wavenumbers
  Grid grid = nullptr;

  //! options with which this `Stretching` was constructed
  StretchingOptions options;

  StretchingImpl() = default;
  StretchingImpl(StretchingOptions const& options_, Grid grid_);
  void reset() override;
  void pretty_print(std::ostream& os) const override;

  //! q = S psi
  void pv_from_streamfunction(torch::Tensor& qh, torch::Tensor const& psih) const;

  //! psi = invS q
  void streamfunction_from_pv(torch::Tensor& psih, torch::Tensor const& qh) const;
};
TORCH_MODULE(Stretching);

}  // namespace mlqg

#undef ADD_ARG

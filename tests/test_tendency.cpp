//! @file test_tendency.cpp
//! @brief Tests for the pseudospectral right-hand side

#include <cmath>
#include <stdexcept>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include <mlqg/equation/equation.hpp>
#include <mlqg/problem/problem.hpp>
#include "device_testing.hpp"

using namespace mlqg;

GTEST_ALLOW_UNINSTANTIATED_PARAMETERIZED_TEST(DeviceTest);

class TendencyTest : public DeviceTest {
 protected:
  Problem make_problem(ParamsOptions const& params, int n = 32,
                       bool linear = false) {
    auto op = ProblemOptions()
                  .grid(GridOptions().nx(n).ny(n))
                  .params(params)
                  .linear(linear);
    return Problem(op, options());
  }
};

TEST_P(TendencyTest, RossbyWave) {
  double beta = 0.6, U = 0.2, k = 2.;
  auto params = ParamsOptions()
                    .nlayers(1)
                    .beta(beta)
                    .U(torch::tensor(U, torch::kFloat64));

  for (bool linear : {false, true}) {
    auto problem = make_problem(params, 32, linear);
    auto X = problem->grid->x.view({1, 1, -1});

    problem->set_q(torch::cos(k * X).expand({1, 32, 32}));
    auto N = problem->grid->invtransform(problem->forward(problem->sol));

    // q = cos(kx) is carried west at U - beta / k^2
    auto expected = (U * k - beta / k) * torch::sin(k * X).expand({1, 32, 32});
    EXPECT_TRUE(torch::allclose(N, expected, 1e-10, 1e-10))
        << "linear = " << linear;
  }
}

TEST_P(TendencyTest, BackgroundFlowOverTopography) {
  double U1 = 0.3, U2 = 0.15;
  int n = 32;

  Grid grid(GridOptions().nx(n).ny(n));
  auto eta = torch::cos(grid->x).view({1, n}).expand({n, n});

  auto problem = make_problem(
      ParamsOptions().U(torch::tensor({U1, U2}, torch::kFloat64)).eta(eta));

  auto N = problem->grid->invtransform(problem->forward(problem->sol));
  auto X = problem->grid->x.view({1, -1});

  EXPECT_TRUE(torch::allclose(N[0], torch::zeros({n, n}, options()), 1e-10,
                              1e-10));
  EXPECT_TRUE(torch::allclose(N[1], (U2 * torch::sin(X)).expand({n, n}), 1e-10,
                              1e-10));
}

TEST_P(TendencyTest, BottomDragActsOnBottomLayer) {
  double mu = 0.1;
  auto problem = make_problem(ParamsOptions().mu(mu));
  auto X = problem->grid->x.view({1, -1});

  // x-only modes carry no advection on an f-plane at rest
  auto psi = torch::stack({torch::cos(X).expand({32, 32}),
                           0.5 * torch::cos(2. * X).expand({32, 32})});
  problem->set_psi(psi);

  auto N = problem->forward(problem->sol);
  EXPECT_TRUE(torch::allclose(N[0], torch::zeros_like(N[0]), 1e-10, 1e-10));
  EXPECT_TRUE(torch::allclose(N[1], mu * problem->grid->Krsq * problem->vars.psih[1],
                              1e-10, 1e-10));

  auto Nphys = problem->grid->invtransform(N);
  EXPECT_TRUE(torch::allclose(Nphys[1], (2. * mu * torch::cos(2. * X)).expand({32, 32}),
                              1e-10, 1e-10));
}

TEST_P(TendencyTest, AdvectionConservesEnergyOnOddGrid) {
  auto problem = make_problem(
      ParamsOptions().nlayers(3).beta(0.3).H({1., 1., 2.}).rho({1., 1.1, 1.3}),
      31);

  problem->set_q(torch::randn({3, 31, 31}, options()));
  auto N = problem->grid->invtransform(problem->forward(problem->sol));
  problem->update_vars();

  auto psi = problem->vars.psi;
  auto work = (psi * N).sum({-2, -1});
  auto scale = (psi.abs() * N.abs()).sum({-2, -1});
  EXPECT_TRUE(torch::all(work.abs() < 1e-10 * scale).item<bool>())
      << work << "\n" << scale;
}

TEST_P(TendencyTest, SolutionIsOnlyRead) {
  auto problem = make_problem(ParamsOptions().beta(0.5).mu(0.02).U(
      torch::tensor({0.1, -0.1}, torch::kFloat64)));

  problem->set_q(torch::randn({2, 32, 32}, options()));
  auto sol = problem->sol.clone();

  auto N = torch::zeros_like(sol);
  problem->tendency(N, problem->sol);

  EXPECT_TRUE(torch::equal(problem->sol, sol));
  EXPECT_TRUE(torch::equal(problem->vars.qh, sol));
}

TEST_P(TendencyTest, LinearizationAtSmallAmplitude) {
  auto params = ParamsOptions().beta(0.5).mu(0.01).U(
      torch::tensor({0.1, 0.}, torch::kFloat64));

  auto full = make_problem(params, 32, false);
  auto lin = make_problem(params, 32, true);
  EXPECT_FALSE(full->eqn.linear);
  EXPECT_TRUE(lin->eqn.linear);

  auto q = 1e-8 * torch::randn({2, 32, 32}, options());
  full->set_q(q);
  lin->set_q(q);

  auto Nf = full->forward(full->sol);
  auto Nl = lin->forward(lin->sol);

  auto err = (Nf - Nl).abs().max().item<double>();
  auto ref = Nl.abs().max().item<double>();
  EXPECT_GT(ref, 0.);
  EXPECT_LT(err, 1e-5 * ref);

  // at finite amplitude the eddy self-advection shows up
  full->set_q(q * 1e8);
  lin->set_q(q * 1e8);
  Nf = full->forward(full->sol);
  Nl = lin->forward(lin->sol);
  EXPECT_FALSE(torch::allclose(Nf, Nl, 1e-6, 1e-6));
}

TEST_P(TendencyTest, ForcingIsAdded) {
  double seen_t = -1.;
  forcing_func calcFq = [&](torch::Tensor Fqh, torch::Tensor const& sol,
                            double t, Clock const& clock, Vars& vars,
                            ParamsImpl const& params, GridImpl const& grid) {
    seen_t = t;
    Fqh.zero_();
    Fqh.select(0, 1).select(0, 2).select(0, 3).fill_(c10::complex<double>(1., -0.5));
  };

  auto base = ParamsOptions().beta(0.5).mu(0.05);
  auto unforced = make_problem(base);
  auto forced = make_problem(ParamsOptions(base).calcFq(calcFq));

  EXPECT_FALSE(unforced->vars.forced());
  EXPECT_TRUE(forced->vars.forced());

  auto q = torch::randn({2, 32, 32}, options());
  unforced->set_q(q);
  forced->set_q(q);
  forced->clock.t = 1.5;

  auto N0 = unforced->forward(unforced->sol);
  auto N1 = forced->forward(forced->sol);

  EXPECT_DOUBLE_EQ(seen_t, 1.5);
  EXPECT_TRUE(torch::allclose(N1 - N0, forced->vars.Fqh, 1e-10, 1e-10));
  EXPECT_NEAR(torch::abs(forced->vars.Fqh[1][2][3]).item<double>(),
              std::hypot(1., 0.5), 1e-14);
}

TEST_P(TendencyTest, ForcingErrorsReachTheCaller) {
  forcing_func calcFq = [](torch::Tensor, torch::Tensor const&, double,
                           Clock const&, Vars&, ParamsImpl const&,
                           GridImpl const&) {
    throw std::runtime_error("forcing failed");
  };

  auto problem = make_problem(ParamsOptions().nlayers(1).calcFq(calcFq));
  EXPECT_THROW(problem->forward(problem->sol), std::runtime_error);
}

TEST_P(TendencyTest, Hyperdissipation) {
  double nu = 1e-3;
  auto problem = make_problem(ParamsOptions().nlayers(3).H({1., 1., 1.}).rho(
                                  {1., 2., 3.}).nu(nu).nnu(2));

  auto const& L = problem->eqn.L;
  EXPECT_EQ(L.size(0), 3);
  EXPECT_EQ(L.size(1), problem->grid->nl);
  EXPECT_EQ(L.size(2), problem->grid->nkr);

  EXPECT_TRUE(torch::all(L.select(-1, 0).select(-1, 0) == 0.).item<bool>());

  // (l, k) = (2, 1) on a 2 pi domain
  EXPECT_NEAR(L[2][2][1].item<double>(), -nu * 25., 1e-14);
  EXPECT_TRUE(torch::allclose(L, hyperdissipation(*problem->params, *problem->grid)));

  auto nodiss = make_problem(ParamsOptions());
  EXPECT_TRUE(torch::all(nodiss->eqn.L == 0.).item<bool>());
}

INSTANTIATE_TEST_SUITE_P(
    DeviceTests, TendencyTest,
    testing::Values(Parameters{torch::kCPU, torch::kFloat64},
                    Parameters{torch::kCUDA, torch::kFloat64}),
    device_test_name);

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

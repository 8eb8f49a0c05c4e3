//! @file test_stretching.cpp
//! @brief Tests for the layer-coupling PV inversion

#include <gtest/gtest.h>
#include <torch/torch.h>

#include <mlqg/grid/grid.hpp>
#include <mlqg/stretching/stretching.hpp>
#include "device_testing.hpp"

using namespace mlqg;

GTEST_ALLOW_UNINSTANTIATED_PARAMETERIZED_TEST(DeviceTest);

class StretchingTest : public DeviceTest {
 protected:
  int nx = 16, ny = 12;
  Grid grid = nullptr;

  void SetUp() override {
    DeviceTest::SetUp();
    if (IsSkipped()) return;
    grid = Grid(GridOptions().nx(nx).ny(ny).Lx(3.0).Ly(2.0));
    grid->to(device, dtype);
  }

  StretchingOptions make_options(int nlayers) {
    auto Fp = torch::rand({nlayers - 1}, torch::kFloat64) + 0.5;
    auto Fm = torch::rand({nlayers - 1}, torch::kFloat64) + 0.5;
    return StretchingOptions()
        .nlayers(nlayers)
        .Fp(std::vector<double>(Fp.data_ptr<double>(),
                                Fp.data_ptr<double>() + nlayers - 1))
        .Fm(std::vector<double>(Fm.data_ptr<double>(),
                                Fm.data_ptr<double>() + nlayers - 1));
  }

  torch::Tensor random_spectrum(int nlayers) {
    auto fh = torch::complex(torch::randn({nlayers, grid->nl, grid->nkr}, options()),
                             torch::randn({nlayers, grid->nl, grid->nkr}, options()));
    fh.select(-1, 0).select(-1, 0).zero_();
    return fh;
  }
};

TEST_P(StretchingTest, CouplingMatrix) {
  auto F = coupling_matrix({1., 2.}, {3., 4.});

  auto expected = torch::tensor({-1., 1., 0., 3., -5., 2., 0., 4., -4.},
                                torch::kFloat64)
                      .view({3, 3});
  EXPECT_TRUE(torch::allclose(F, expected));

  // rows sum to zero: a depth-independent streamfunction is not stretched
  EXPECT_TRUE(torch::allclose(F.sum(-1), torch::zeros({3}, torch::kFloat64)));

  EXPECT_THROW(coupling_matrix({1.}, {1., 2.}), c10::Error);
}

TEST_P(StretchingTest, InverseIsInverse) {
  for (int nlayers = 1; nlayers <= 5; ++nlayers) {
    auto op = make_options(nlayers);

    torch::Tensor S, invS;
    calc_stretching(S, invS, op.Fp(), op.Fm(), *grid);

    EXPECT_EQ(S.size(0), grid->nl);
    EXPECT_EQ(S.size(1), grid->nkr);
    EXPECT_EQ(S.size(2), nlayers);
    EXPECT_EQ(S.size(3), nlayers);

    auto prod = torch::matmul(S, invS).view({-1, nlayers, nlayers});
    auto eye = torch::eye(nlayers, options()).expand_as(prod);

    // every wavenumber but the origin
    int n = prod.size(0);
    EXPECT_TRUE(torch::allclose(prod.narrow(0, 1, n - 1),
                                eye.narrow(0, 1, n - 1), 1e-10, 1e-10))
        << "nlayers = " << nlayers;

    EXPECT_TRUE(torch::all(invS[0][0] == 0.).item<bool>());
  }
}

TEST_P(StretchingTest, RoundTrip) {
  for (int nlayers : {2, 3, 5}) {
    Stretching stretching(make_options(nlayers), grid);

    auto psih = random_spectrum(nlayers);
    auto qh = torch::empty_like(psih);
    auto psih2 = torch::empty_like(psih);

    stretching->pv_from_streamfunction(qh, psih);
    stretching->streamfunction_from_pv(psih2, qh);
    EXPECT_TRUE(torch::allclose(psih, psih2, 1e-10, 1e-10))
        << "nlayers = " << nlayers;

    auto qh0 = random_spectrum(nlayers);
    auto qh2 = torch::empty_like(qh0);

    stretching->streamfunction_from_pv(psih, qh0);
    stretching->pv_from_streamfunction(qh2, psih);
    EXPECT_TRUE(torch::allclose(qh0, qh2, 1e-10, 1e-10))
        << "nlayers = " << nlayers;
  }
}

TEST_P(StretchingTest, MeanPVDoesNotReachStreamfunction) {
  Stretching stretching(make_options(3), grid);

  auto qh = torch::zeros({3, grid->nl, grid->nkr}, complex_options());
  qh.select(-1, 0).select(-1, 0).fill_(5.);

  auto psih = torch::ones_like(qh);
  stretching->streamfunction_from_pv(psih, qh);
  EXPECT_TRUE(torch::allclose(psih, torch::zeros_like(psih)));
}

TEST_P(StretchingTest, BarotropicModeIsUncoupled) {
  Stretching stretching(make_options(4), grid);

  auto psih = random_spectrum(1).expand({4, grid->nl, grid->nkr}).contiguous();
  auto qh = torch::empty_like(psih);
  stretching->pv_from_streamfunction(qh, psih);

  EXPECT_TRUE(torch::allclose(qh, -grid->Krsq * psih, 1e-10, 1e-10));
}

TEST_P(StretchingTest, SingleLayerMatchesMatrixPath) {
  Stretching stretching(StretchingOptions().nlayers(1), grid);
  EXPECT_FALSE(stretching->S.defined());
  EXPECT_FALSE(stretching->invS.defined());

  torch::Tensor S, invS;
  calc_stretching(S, invS, {}, {}, *grid);

  auto psih = random_spectrum(1);
  auto qh = torch::empty_like(psih);
  stretching->pv_from_streamfunction(qh, psih);
  EXPECT_TRUE(torch::allclose(qh, layer_matvec(S, psih), 1e-10, 1e-10));

  // q = -k^2 psi at a known wavenumber
  double k = constants::two_pi / 3.0, m = constants::two_pi / 2.0;
  auto expected = -(k * k + m * m) * psih[0][1][1];
  EXPECT_TRUE(torch::allclose(qh[0][1][1], expected, 1e-10, 1e-10));

  auto qh0 = random_spectrum(1);
  stretching->streamfunction_from_pv(psih, qh0);
  EXPECT_TRUE(torch::allclose(psih, layer_matvec(invS, qh0), 1e-10, 1e-10));

  qh0[0][0][0] = 1.;
  stretching->streamfunction_from_pv(psih, qh0);
  EXPECT_EQ(torch::abs(psih[0][0][0]).item<double>(), 0.);
}

TEST_P(StretchingTest, RejectsInconsistentCoefficients) {
  EXPECT_THROW(Stretching(StretchingOptions().nlayers(3).Fp({1.}).Fm({1.}), grid),
               c10::Error);
  EXPECT_THROW(Stretching(StretchingOptions().nlayers(0), grid), c10::Error);
}

INSTANTIATE_TEST_SUITE_P(
    DeviceTests, StretchingTest,
    testing::Values(Parameters{torch::kCPU, torch::kFloat64},
                    Parameters{torch::kCUDA, torch::kFloat64}),
    device_test_name);

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

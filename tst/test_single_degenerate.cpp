//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file test_single_degenerate.cpp
//  \brief tests of the single-degenerate DTD derivation and its re-binning

#include <cmath>
#include <vector>

#include <gtest/gtest.h>

#include "chemevo.hpp"
#include "snia/snia_dtd.hpp"
#include "stellar/imf.hpp"
#include "stellar/lifetime.hpp"

namespace {
// every secondary heavier than the heaviest WD progenitor
Real HeavySecondary(Real) { return 9.0; }
} // namespace

class SingleDegenerateTest : public ::testing::Test {
 protected:
  void SetUp() override {
    grid.dt = 30.0;
    grid.nsteps = 401;   // time_tot = 12 Gyr
  }
  snia::TimeGrid grid;
};

TEST_F(SingleDegenerateTest, ArrayShapes) {
  snia::DTDKernel kernel = snia::BuildDTD("single_degenerate", {}, grid);
  const snia::SingleDegenerateGrid &fg = kernel.single_degenerate_grid();
  EXPECT_EQ(kernel.nria(), grid.nsteps - 1);
  ASSERT_EQ(fg.t2.extent(0), 11972u);
  EXPECT_DOUBLE_EQ(fg.t2(0), 29.0);
  EXPECT_DOUBLE_EQ(fg.t2(fg.t2.extent(0) - 1), 12000.0);
  ASSERT_EQ(static_cast<int>(fg.bin_edges.size()), grid.nsteps);
  EXPECT_EQ(fg.bin_edges[0], 0);
  EXPECT_EQ(fg.bin_edges[1], 1);     // bin 0 holds t2 = 29 only
  EXPECT_EQ(fg.bin_edges[2], 31);    // bin 1 holds t2 = 30..59
  EXPECT_EQ(fg.bin_edges[grid.nsteps-1], 11971);
}

TEST_F(SingleDegenerateTest, RebinningIsExactPartition) {
  snia::DTDKernel kernel = snia::BuildDTD("single_degenerate", {}, grid);
  const snia::SingleDegenerateGrid &fg = kernel.single_degenerate_grid();
  const int nfine = static_cast<int>(fg.ria1.extent(0));

  Real coarse = 0.0, fine = 0.0;
  for (int j = 0; j < kernel.nria(); ++j) {
    Real bin = 0.0;
    for (int k = fg.bin_edges[j]; k < fg.bin_edges[j+1]; ++k) {
      // fine entry k lands in coarse bin floor(t2/dt)
      EXPECT_EQ(static_cast<int>(std::floor(fg.t2(k)/grid.dt)), j);
      bin += fg.ria1(k);
    }
    EXPECT_EQ(kernel.Ria(j), bin);
    coarse += kernel.Ria(j);
  }
  // the last fine point, t2 = t[-1], belongs to no bin
  for (int k = 0; k < nfine - 1; ++k) fine += fg.ria1(k);
  EXPECT_NEAR(coarse/fine, 1.0, 1.0e-12);
}

TEST_F(SingleDegenerateTest, UnnormalizedTotalIsRealizationTimesKAlpha) {
  snia::DTDKernel kernel = snia::BuildDTD("single_degenerate", {{"A", "1e-3"}}, grid);
  const snia::SingleDegenerateGrid &fg = kernel.single_degenerate_grid();
  stellar::IMF imf = stellar::IMF::Kroupa();
  Real total = 0.0;
  for (std::size_t k = 0; k < fg.ria1.extent(0); ++k) total += fg.ria1(k);
  EXPECT_NEAR(total/(1.0e-3*imf.TotalNumber()/imf.TotalMass()), 1.0, 1.0e-12);
}

TEST_F(SingleDegenerateTest, PhysicalBounds) {
  snia::DTDKernel kernel = snia::BuildDTD("single_degenerate", {}, grid);
  const snia::SingleDegenerateGrid &fg = kernel.single_degenerate_grid();
  for (std::size_t k = 0; k < fg.t2.extent(0); ++k) {
    EXPECT_GE(fg.m1low(k), fg.m2(k));
    EXPECT_GE(fg.m1low(k), 2.0);
    EXPECT_GE(fg.nm2(k), 0.0);
    EXPECT_GE(fg.ria1(k), 0.0);
  }
  for (int j = 0; j < kernel.nria(); ++j) {
    EXPECT_GE(kernel.Ria(j), 0.0);
    EXPECT_TRUE(std::isfinite(kernel.Ria(j)));
  }
}

TEST_F(SingleDegenerateTest, NormalizeScalesTo10GyrTotal) {
  snia::DTDKernel kernel = snia::BuildDTD("single_degenerate",
      {{"normalize", "true"}, {"nia_per_mstar", "2e-3"}}, grid);
  Real sum = 0.0;
  for (int j = 0; j < kernel.nria() && grid.Time(j) <= 1.0e4; ++j) sum += kernel.Ria(j);
  EXPECT_NEAR(sum/2.0e-3, 1.0, 1.0e-12);

  // partition still exact after rescaling
  const snia::SingleDegenerateGrid &fg = kernel.single_degenerate_grid();
  for (int j = 0; j < kernel.nria(); ++j) {
    Real bin = 0.0;
    for (int k = fg.bin_edges[j]; k < fg.bin_edges[j+1]; ++k) bin += fg.ria1(k);
    EXPECT_EQ(kernel.Ria(j), bin);
  }
}

TEST_F(SingleDegenerateTest, FineStepGrid) {
  snia::TimeGrid fine_grid = {1.0, 201};
  snia::DTDKernel kernel = snia::BuildDTD("single_degenerate", {}, fine_grid);
  const snia::SingleDegenerateGrid &fg = kernel.single_degenerate_grid();
  for (int j = 0; j < 29; ++j) EXPECT_EQ(kernel.Ria(j), 0.0);
  EXPECT_EQ(kernel.Ria(29), fg.ria1(0));
  EXPECT_EQ(kernel.Ria(199), fg.ria1(170));
}

TEST_F(SingleDegenerateTest, CoarseStepFirstBinAbsorbsEarlyTimes) {
  snia::TimeGrid coarse_grid = {50.0, 241};
  snia::DTDKernel kernel = snia::BuildDTD("single_degenerate", {}, coarse_grid);
  const snia::SingleDegenerateGrid &fg = kernel.single_degenerate_grid();
  EXPECT_EQ(fg.bin_edges[1], 21);    // t2 = 29..49
  Real bin0 = 0.0;
  for (int k = 0; k < 21; ++k) bin0 += fg.ria1(k);
  EXPECT_EQ(kernel.Ria(0), bin0);
}

TEST_F(SingleDegenerateTest, RequiresWholeMyrStep) {
  snia::TimeGrid bad = {25.5, 401};
  EXPECT_THROW(snia::BuildDTD("single_degenerate", {}, bad), snia::InvalidParameterError);
  bad = {10.0, 3};
  EXPECT_THROW(snia::BuildDTD("single_degenerate", {}, bad), snia::InvalidParameterError);
}

TEST_F(SingleDegenerateTest, EmptyDistributionCannotBeNormalized) {
  snia::StellarPhysics physics;
  physics.mass_from_lifetime = &HeavySecondary;
  EXPECT_THROW(snia::BuildDTD("single_degenerate", {}, grid, physics),
               snia::NormalizationError);
}

// With IMF breaks at 0.5 and 4 Msun the minimum primary mass enters the middle segment
// (m1low < 4) around t2 = 118 Myr and leaves it again near t2 = 7 Gyr.  The last index
// of that range is dropped from the middle segment and claimed by no other.
TEST_F(SingleDegenerateTest, InnerSegmentDropsLastIndex) {
  snia::StellarPhysics physics;
  physics.imf = stellar::IMF({1.3, 2.3, 2.7}, {0.5, 4.0}, 0.1, 100.0);
  snia::DTDKernel kernel = snia::BuildDTD("single_degenerate", {}, grid, physics);
  const snia::SingleDegenerateGrid &fg = kernel.single_degenerate_grid();
  const int nfine = static_cast<int>(fg.t2.extent(0));

  std::vector<int> middle;
  for (int k = 0; k < nfine; ++k) {
    Real m1r = std::round(fg.m1low(k)*1.0e5)/1.0e5;
    if (m1r >= 0.5 && m1r < 4.0) middle.push_back(k);
  }
  ASSERT_GT(middle.size(), 2u);
  int klast = middle.back();
  ASSERT_LT(klast, nfine - 1);
  EXPECT_EQ(fg.nm2(klast), 0.0);
  EXPECT_GT(fg.nm2(klast-1), 0.0);
  EXPECT_GT(fg.nm2(klast+1), 0.0);
  // first index of the middle range and the outer segment are kept
  EXPECT_GT(fg.nm2(middle.front()), 0.0);
  EXPECT_GT(fg.nm2(0), 0.0);

  int nzero = 0;
  for (int k = 0; k < nfine; ++k) {
    if (fg.nm2(k) == 0.0) nzero++;
  }
  EXPECT_EQ(nzero, 1);
}

TEST_F(SingleDegenerateTest, RepeatedBuildIsIdentical) {
  snia::DTDParameters params = {{"gam", "1.5"}, {"eps", "0.8"}, {"normalize", "1"}};
  snia::DTDKernel k1 = snia::BuildDTD("single_degenerate", params, grid);
  snia::DTDKernel k2 = snia::BuildDTD("single_degenerate", params, grid);
  ASSERT_EQ(k1.nria(), k2.nria());
  for (int j = 0; j < k1.nria(); ++j) EXPECT_EQ(k1.Ria(j), k2.Ria(j));
  EXPECT_DOUBLE_EQ(k1.single_degenerate().gam, 1.5);
  EXPECT_TRUE(k1.single_degenerate().normalize);
}

//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file test_snia_events.cpp
//  \brief tests of the per-step SNIa count of every DTD model

#include <cmath>
#include <stdexcept>

#include <gtest/gtest.h>

#include "chemevo.hpp"
#include "snia/snia_dtd.hpp"
#include "snia/snia_events.hpp"

class SNIaEventsTest : public ::testing::Test {
 protected:
  SNIaEventsTest() : sfh(kNsteps, 2), reservoir(kNsteps) {
    grid.dt = 30.0;
    grid.nsteps = kNsteps;
  }

  // fills every step from 1 on with sfr = sfr0, split 60/40 over the two mass bins
  void ConstantSFH(Real sfr0) {
    auto mstar = Kokkos::create_mirror_view(sfh.mstar);
    auto sfr = Kokkos::create_mirror_view(sfh.sfr);
    auto mstar_tot = Kokkos::create_mirror_view(sfh.mstar_tot);
    Real mtot = 0.0;
    for (int n = 0; n < kNsteps; ++n) {
      sfr(n) = (n == 0) ? 0.0 : sfr0;
      mtot += sfr(n)*grid.dt;
      mstar(n, 0) = 0.6*sfr(n)*grid.dt;
      mstar(n, 1) = 0.4*sfr(n)*grid.dt;
      mstar_tot(n) = mtot;
    }
    Kokkos::deep_copy(sfh.mstar, mstar);
    Kokkos::deep_copy(sfh.sfr, sfr);
    Kokkos::deep_copy(sfh.mstar_tot, mstar_tot);
  }

  // a single population of 1 Msun formed in step nburst
  void SingleBurst(int nburst) {
    auto mstar = Kokkos::create_mirror_view(sfh.mstar);
    Kokkos::deep_copy(mstar, 0.0);
    mstar(nburst, 0) = 0.25;
    mstar(nburst, 1) = 0.75;
    Kokkos::deep_copy(sfh.mstar, mstar);
  }

  static constexpr int kNsteps = 401;
  snia::TimeGrid grid;
  snia::StarFormationHistory sfh;
  snia::WDReservoir reservoir;
};

TEST_F(SNIaEventsTest, ExponentialIdleBeforeMinimumDelay) {
  snia::DTDKernel kernel = snia::BuildDTD("exponential", {}, grid);
  for (int n = 1; n <= 4; ++n) reservoir.Deposit(n, 1.0);
  EXPECT_EQ(snia::SNIaEvents(kernel, 4, sfh, reservoir), 0.0);
  for (int n = 1; n <= 4; ++n) EXPECT_EQ(reservoir.Mass(n), 1.0);
}

TEST_F(SNIaEventsTest, ExponentialCountsBeforeDecay) {
  snia::DTDKernel kernel = snia::BuildDTD("exponential", {}, grid);
  reservoir.Deposit(1, 10.0);
  reservoir.Deposit(2, 5.0);
  // ind_min_t = 6 - 5 = 1: entries 0 and 1 are old enough
  Real count = snia::SNIaEvents(kernel, 6, sfh, reservoir);
  EXPECT_DOUBLE_EQ(count, 10.0*0.02/sfh.snia_mass);
  EXPECT_DOUBLE_EQ(reservoir.Mass(1), 9.8);
  EXPECT_DOUBLE_EQ(reservoir.Mass(2), 5.0);

  count = snia::SNIaEvents(kernel, 7, sfh, reservoir);
  EXPECT_DOUBLE_EQ(count, (9.8 + 5.0)*0.02/sfh.snia_mass);
  EXPECT_DOUBLE_EQ(reservoir.Mass(1), 9.8*0.98);
  EXPECT_DOUBLE_EQ(reservoir.Mass(2), 5.0*0.98);

  auto host = reservoir.HostCopy();
  ASSERT_EQ(static_cast<int>(host.extent(0)), kNsteps);
  EXPECT_EQ(host(0), 0.0);
  EXPECT_DOUBLE_EQ(host(1), 9.8*0.98);
}

TEST_F(SNIaEventsTest, ExponentialConservesMass) {
  snia::DTDKernel kernel = snia::BuildDTD("exponential", {{"timescale", "900"}}, grid);
  Real deposited = 0.0, exploded = 0.0;
  for (int n = 1; n < kNsteps; ++n) {
    Real m = 0.01*(1.0 + std::sin(0.1*n));
    reservoir.Deposit(n, m);
    deposited += m;
    Real count = snia::SNIaEvents(kernel, n, sfh, reservoir);
    EXPECT_GE(count, 0.0);
    exploded += count*sfh.snia_mass;
  }
  EXPECT_NEAR((exploded + reservoir.TotalMass())/deposited, 1.0, 1.0e-12);
  EXPECT_GT(exploded, 0.0);
}

TEST_F(SNIaEventsTest, ExponentialShortestTimescaleEmptiesReservoir) {
  snia::DTDKernel kernel = snia::BuildDTD("exponential", {{"timescale", "30"}}, grid);
  reservoir.Deposit(1, 1.0);
  EXPECT_DOUBLE_EQ(snia::SNIaEvents(kernel, 6, sfh, reservoir), 1.0/sfh.snia_mass);
  EXPECT_EQ(reservoir.Mass(1), 0.0);
  EXPECT_EQ(snia::SNIaEvents(kernel, 7, sfh, reservoir), 0.0);
}

TEST_F(SNIaEventsTest, ExponentialChecksReservoirSize) {
  snia::DTDKernel kernel = snia::BuildDTD("exponential", {}, grid);
  snia::WDReservoir small(10);
  EXPECT_THROW(snia::SNIaEvents(kernel, 20, sfh, small), std::out_of_range);
  EXPECT_THROW(small.Deposit(10, 1.0), std::out_of_range);
  EXPECT_THROW(small.Deposit(-1, 1.0), std::out_of_range);
}

TEST_F(SNIaEventsTest, PowerLawSingleBurstReproducesKernel) {
  snia::DTDKernel kernel = snia::BuildDTD("power_law", {}, grid);
  const int nburst = 3;
  SingleBurst(nburst);
  // same step: ria[0] = 0
  EXPECT_EQ(snia::SNIaEvents(kernel, nburst, sfh, reservoir), 0.0);
  for (int age = 1; age < 50; ++age) {
    Real count = snia::SNIaEvents(kernel, nburst + age, sfh, reservoir);
    EXPECT_DOUBLE_EQ(count, kernel.Ria(age)) << "age = " << age;
  }
}

TEST_F(SNIaEventsTest, SingleDegenerateConvolution) {
  snia::DTDKernel kernel = snia::BuildDTD("single_degenerate", {}, grid);
  ConstantSFH(2.0);
  // every earlier step formed 60 Msun; step n sees ria[0..n-1] of it
  for (int n : {1, 2, 10, 200, 400}) {
    Real expected = 0.0;
    for (int i = 0; i < n; ++i) expected += kernel.Ria(i)*60.0;
    Real count = snia::SNIaEvents(kernel, n, sfh, reservoir);
    EXPECT_NEAR(count, expected, 1.0e-12*expected) << "n = " << n;
  }
}

TEST_F(SNIaEventsTest, PromptDelayedArithmetic) {
  snia::DTDKernel kernel = snia::BuildDTD("prompt_delayed", {}, grid);
  auto sfr = Kokkos::create_mirror_view(sfh.sfr);
  auto mstar_tot = Kokkos::create_mirror_view(sfh.mstar_tot);
  for (int n = 0; n < kNsteps; ++n) {
    sfr(n) = 1.0 + n;
    mstar_tot(n) = 100.0*n;
  }
  Kokkos::deep_copy(sfh.sfr, sfr);
  Kokkos::deep_copy(sfh.mstar_tot, mstar_tot);

  const Real a = 4.4e-8, b = 2.6e3;
  // ind = 5 - ceil(40/30) = 3
  EXPECT_DOUBLE_EQ(snia::SNIaEvents(kernel, 5, sfh, reservoir),
                   (4.0*b + 500.0*a)*30.0);
  // ind = 0: no prompt term
  EXPECT_DOUBLE_EQ(snia::SNIaEvents(kernel, 2, sfh, reservoir), 200.0*a*30.0);
}

TEST_F(SNIaEventsTest, StepOutsideGridThrows) {
  snia::DTDKernel kernel = snia::BuildDTD("power_law", {}, grid);
  EXPECT_THROW(snia::SNIaEvents(kernel, -1, sfh, reservoir), std::out_of_range);
  EXPECT_THROW(snia::SNIaEvents(kernel, kNsteps, sfh, reservoir), std::out_of_range);
}

TEST_F(SNIaEventsTest, CountsNonNegativeAndReservoirUntouched) {
  ConstantSFH(1.5);
  for (const char *model : {"power_law", "prompt_delayed", "single_degenerate"}) {
    snia::DTDKernel kernel = snia::BuildDTD(model, {}, grid);
    reservoir.Deposit(1, 3.0);
    Real before = reservoir.TotalMass();
    for (int n = 0; n < kNsteps; ++n) {
      EXPECT_GE(snia::SNIaEvents(kernel, n, sfh, reservoir), 0.0) << model << " " << n;
    }
    EXPECT_EQ(reservoir.TotalMass(), before) << model;
  }
}

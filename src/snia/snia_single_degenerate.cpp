//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file snia_single_degenerate.cpp
//  \brief SNIa DTD of the single-degenerate channel following Greggio (2005, A&A 441,
//  1055).  The secondary of mass m2 leaves the main sequence at t2; a SNIa requires a
//  primary massive enough that its WD plus the accreted secondary envelope reaches the
//  Chandrasekhar mass.  The rate is derived at 1 Myr resolution and then summed onto
//  the dt-spaced simulation grid.

#include <cmath>
#include <limits>
#include <sstream>
#include <vector>

#include "chemevo.hpp"
#include "snia_dtd.hpp"

namespace snia {

namespace {
constexpr Real kFineStart = 29.0;   // Myr, lifetime of a ~8 Msun secondary
constexpr Real kMChandra = 1.4;     // Msun
constexpr Real kM1Floor = 2.0;      // Msun, lightest primary producing a CO WD
constexpr Real kM1Up = 8.0;         // Msun, heaviest primary producing a WD
}

//----------------------------------------------------------------------------------------
//! \fn void DTDKernel::BuildSingleDegenerate()
//! \brief fills the fine-grid arrays of sd_grid_ and the coarse kernel ria_

void DTDKernel::BuildSingleDegenerate(const StellarPhysics &physics) {
  Real dt = grid_.dt;
  Real tlast = grid_.TimeTot();
  if (std::fabs(dt - std::round(dt)) > 1.0e-9) {
    std::stringstream msg;
    msg << "single_degenerate DTD requires dt to be a whole number of Myr (dt = "
        << dt << ")";
    throw InvalidParameterError(msg.str());
  }
  if (tlast <= kFineStart + 1.0) {
    std::stringstream msg;
    msg << "single_degenerate DTD requires time_tot > " << kFineStart + 1.0
        << " Myr (time_tot = " << tlast << ")";
    throw InvalidParameterError(msg.str());
  }

  const int nfine = static_cast<int>(std::lround(tlast - kFineStart)) + 1;
  auto &fg = sd_grid_;
  fg.t2 = HostArray1D<Real>("t2", nfine);
  fg.m2 = HostArray1D<Real>("m2", nfine);
  fg.m1low = HostArray1D<Real>("m1low", nfine);
  fg.nm2 = HostArray1D<Real>("nm2", nfine);
  fg.ria1 = HostArray1D<Real>("ria1", nfine);

  auto t2 = fg.t2;
  auto m2 = fg.m2;
  auto m1low = fg.m1low;
  auto nm2 = fg.nm2;
  Real eps = sdeg_.eps;
  stellar::MassFromLifetimeFn mass_from_lifetime = physics.mass_from_lifetime;

  // (1)-(3) secondary mass, its core and envelope, and the minimum primary mass.  Each
  // "maximum of branches" is taken element-wise so the floor functions stay continuous.
  par_for("sd_primary_mass", HostExeSpace(), 0, nfine-1, [=](const int k) {
    t2(k) = kFineStart + static_cast<Real>(k);
    m2(k) = mass_from_lifetime(t2(k));
    Real m2c = std::fmax(std::fmax(0.3*std::sqrt(m2(k)), 0.3 + 0.1*m2(k)),
                         0.5 + 0.15*(m2(k) - 3.0));
    Real m2e = m2(k) - m2c;
    Real mwdn = kMChandra - eps*m2e;
    Real m1na = std::fmax(kM1Floor, kM1Floor + 10.0*(mwdn - 0.6));
    m1low(k) = std::fmax(m1na, m2(k));
    nm2(k) = 0.0;
  });

  // (4) secondary mass distribution on each IMF segment.  Membership uses m1low rounded
  // to 5 decimals.  Every segment except the last drops the last index of its range,
  // which is left to the neighbouring segment's integral.
  const auto &alpha = physics.imf.alpha();
  const auto &breaks = physics.imf.mass_breaks();
  const int nseg = physics.imf.nsegments();
  Real gam = sdeg_.gam;
  for (int i = 0; i < nseg; ++i) {
    Real lower = (i == 0) ? -std::numeric_limits<Real>::max() : breaks[i-1];
    Real upper = (i == nseg-1) ? std::numeric_limits<Real>::max() : breaks[i];
    std::vector<int> ind;
    for (int k = 0; k < nfine; ++k) {
      Real m1r = std::round(m1low(k)*1.0e5)/1.0e5;
      if (m1r >= lower && m1r < upper) ind.push_back(k);
    }
    if (i < nseg-1 && !ind.empty()) ind.pop_back();

    Real ag = alpha[i] + gam;
    for (int k : ind) {
      Real val = std::pow(m2(k), -alpha[i])*(std::pow(m2(k)/m1low(k), ag) -
                                             std::pow(m2(k)/kM1Up, ag));
      nm2(k) = std::fmax(val, 0.0);
    }
  }

  // (5) formation rate -> appearance rate, dm2/dt = 10^4.28 t2^1.44
  HostArray1D<Real> fia2("fia2", nfine);
  par_for("sd_fia2", HostExeSpace(), 0, nfine-1, [=](const int k) {
    fia2(k) = nm2(k)/(std::pow(10.0, 4.28)*std::pow(t2(k), 1.44));
  });
  Real fsum = 0.0;
  for (int k = 0; k < nfine; ++k) fsum += fia2(k);
  if (!(fsum > 0.0) || !std::isfinite(fsum)) {
    std::stringstream msg;
    msg << "single_degenerate DTD cannot be normalized: integrated secondary mass "
        << "distribution is " << fsum;
    throw NormalizationError(msg.str());
  }

  Real k_alpha = physics.imf.TotalNumber()/physics.imf.TotalMass();
  Real scale = k_alpha*sdeg_.a/fsum;
  auto ria1 = fg.ria1;
  par_for("sd_ria1", HostExeSpace(), 0, nfine-1, [=](const int k) {
    ria1(k) = scale*fia2(k);
  });

  // (6) coarse bins
  const int nsteps = grid_.nsteps;
  const int idt = static_cast<int>(std::lround(dt));
  fg.bin_edges.assign(nsteps, 0);
  for (int j = 0; j < nsteps; ++j) {
    int edge = j*idt - static_cast<int>(kFineStart);
    fg.bin_edges[j] = (edge < 0) ? 0 : edge;
  }
  ria_ = DualArray1D<Real>("ria", nsteps-1);
  RebinSingleDegenerate();

  // (7) optional normalization to nia_per_mstar within 10 Gyr
  if (sdeg_.normalize) {
    Real denom = 0.0;
    for (int j = 0; j < nsteps-1 && grid_.Time(j) <= 1.0e4; ++j) {
      denom += ria_.h_view(j);
    }
    if (!(denom > 0.0) || !std::isfinite(denom)) {
      std::stringstream msg;
      msg << "single_degenerate DTD cannot be normalized: rate integrated over 10 Gyr "
          << "is " << denom;
      throw NormalizationError(msg.str());
    }
    Real norm = sdeg_.nia_per_mstar/denom;
    par_for("sd_norm", HostExeSpace(), 0, nfine-1, [=](const int k) {
      ria1(k) *= norm;
    });
    RebinSingleDegenerate();
  }
  SyncRia();
}

//----------------------------------------------------------------------------------------
//! \fn void DTDKernel::RebinSingleDegenerate()
//! \brief coarse bin j is the ordered sum of ria1 over [bin_edges[j], bin_edges[j+1])

void DTDKernel::RebinSingleDegenerate() {
  auto ria = ria_.h_view;
  auto ria1 = sd_grid_.ria1;
  const auto &edges = sd_grid_.bin_edges;
  for (int j = 0; j < grid_.nsteps-1; ++j) {
    Real sum = 0.0;
    for (int k = edges[j]; k < edges[j+1]; ++k) sum += ria1(k);
    ria(j) = sum;
  }
}

} // namespace snia

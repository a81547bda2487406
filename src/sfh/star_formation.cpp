//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file star_formation.cpp
//  \brief implementation of StarFormationDriver

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "chemevo.hpp"
#include "globals.hpp"
#include "parameter_input.hpp"
#include "star_formation.hpp"

namespace {
//----------------------------------------------------------------------------------------
// mass bins of width dm_low below 8 Msun and dm_high above, from mbins_low to mbins_high

std::vector<Real> MassBinEdges(ParameterInput *pin) {
  Real mlow = pin->GetOrAddReal("imf", "mbins_low", 0.1);
  Real mhigh = pin->GetOrAddReal("imf", "mbins_high", 100.0);
  Real dm_low = pin->GetOrAddReal("imf", "dm_low", 0.1);
  Real dm_high = pin->GetOrAddReal("imf", "dm_high", 1.0);
  const Real mbreak = 8.0;
  if (mlow <= 0.0 || mhigh <= mlow || dm_low <= 0.0 || dm_high <= 0.0) {
    std::cout << "### FATAL ERROR in " << __FILE__ << " at line " << __LINE__ << std::endl
              << "Mass bins require 0 < mbins_low < mbins_high and dm_low, dm_high > 0"
              << std::endl;
    std::exit(EXIT_FAILURE);
  }

  std::vector<Real> edges;
  Real mid = std::fmin(mbreak, mhigh);
  int nlow = static_cast<int>(std::ceil((mid - mlow)/dm_low - 1.0e-9));
  for (int k = 0; k < nlow; ++k) edges.push_back(mlow + k*dm_low);
  edges.push_back(mid);
  if (mhigh > mbreak) {
    int nhigh = static_cast<int>(std::ceil((mhigh - mbreak)/dm_high - 1.0e-9));
    for (int k = 1; k < nhigh; ++k) edges.push_back(mbreak + k*dm_high);
    edges.push_back(mhigh);
  }
  return edges;
}
} // namespace

//----------------------------------------------------------------------------------------
// constructor, parses <star_formation> and <imf> blocks and sets up mass bins

StarFormationDriver::StarFormationDriver(ParameterInput *pin, const snia::TimeGrid &grid,
                                         const stellar::IMF &imf) :
  mbin_edges(MassBinEdges(pin)),
  sfh(grid.nsteps, static_cast<int>(mbin_edges.size()) - 1,
      pin->GetOrAddReal("star_formation", "snia_mass", 1.374)),
  mbin_mass_frac("mbin_mass_frac", mbin_edges.size() - 1),
  grid_(grid) {
  std::string sfr_func = pin->GetOrAddString("star_formation", "sfr_func", "constant");
  if (sfr_func.compare("constant") == 0) {
    sfr_func_ = SFRFunc::constant;
  } else if (sfr_func.compare("exponential") == 0) {
    sfr_func_ = SFRFunc::exponential;
  } else {
    std::cout << "### FATAL ERROR in " << __FILE__ << " at line " << __LINE__ << std::endl
              << "sfr_func = '" << sfr_func << "' not recognized; use constant or "
              << "exponential" << std::endl;
    std::exit(EXIT_FAILURE);
  }
  sfr0_ = pin->GetOrAddReal("star_formation", "sfr0", 1.0);
  tau_ = pin->GetOrAddReal("star_formation", "tau", 3000.0);
  if (sfr_func_ == SFRFunc::exponential && tau_ <= 0.0) {
    std::cout << "### FATAL ERROR in " << __FILE__ << " at line " << __LINE__ << std::endl
              << "exponential star formation requires tau > 0" << std::endl;
    std::exit(EXIT_FAILURE);
  }

  // white dwarfs: remnants of wd_mlow..wd_mup Msun stars
  Real wd_mlow = pin->GetOrAddReal("star_formation", "wd_mlow", 3.2);
  Real wd_mup = pin->GetOrAddReal("star_formation", "wd_mup", 8.0);
  Real wd_remnant = pin->GetOrAddReal("star_formation", "wd_remnant_fraction", 0.15);
  wd_mass_frac_ = wd_remnant*imf.MassIntegral(wd_mlow, wd_mup)/imf.TotalMass();

  int nbins = static_cast<int>(mbin_edges.size()) - 1;
  Real mtot = imf.MassIntegral(mbin_edges.front(), mbin_edges.back());
  for (int b = 0; b < nbins; ++b) {
    mbin_mass_frac.h_view(b) = imf.MassIntegral(mbin_edges[b], mbin_edges[b+1])/mtot;
  }
  mbin_mass_frac.template modify<HostMemSpace>();
  mbin_mass_frac.template sync<DevExeSpace>();

  if (global_variable::my_rank == 0) {
    std::cout << "Star formation: sfr_func = " << sfr_func << " sfr0 = " << sfr0_
              << " nbins = " << nbins << " WD mass fraction = " << wd_mass_frac_
              << std::endl;
  }
}

//----------------------------------------------------------------------------------------
//! \fn Real StarFormationDriver::SFR(Real time)
//! \brief star formation rate [Msun/Myr] at time [Myr]

Real StarFormationDriver::SFR(Real time) const {
  switch (sfr_func_) {
    case SFRFunc::constant: return sfr0_;
    case SFRFunc::exponential: return sfr0_*std::exp(-time/tau_);
  }
  return 0.0;
}

//----------------------------------------------------------------------------------------
//! \fn Real StarFormationDriver::FormStars(int tstep)
//! \brief forms sfr*dt of stars in step tstep, split over mass bins by the IMF

Real StarFormationDriver::FormStars(int tstep) {
  sfr_now_ = SFR(grid_.Time(tstep));
  Real mformed = sfr_now_*grid_.dt;
  mstar_tot_ += mformed;

  Kokkos::deep_copy(Kokkos::subview(sfh.sfr, tstep), sfr_now_);
  Kokkos::deep_copy(Kokkos::subview(sfh.mstar_tot, tstep), mstar_tot_);

  auto mstar = sfh.mstar;
  auto frac = mbin_mass_frac.d_view;
  par_for("form_stars", DevExeSpace(), 0, sfh.nbins()-1, KOKKOS_LAMBDA(const int b) {
    mstar(tstep, b) = mformed*frac(b);
  });
  return mformed*wd_mass_frac_;
}

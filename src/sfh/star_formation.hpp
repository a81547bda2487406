#ifndef SFH_STAR_FORMATION_HPP_
#define SFH_STAR_FORMATION_HPP_
//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file star_formation.hpp
//  \brief prescribed star formation history that feeds the SNIa event engine

#include <vector>

#include "chemevo.hpp"
#include "parameter_input.hpp"
#include "snia/snia_dtd.hpp"
#include "snia/snia_events.hpp"
#include "stellar/imf.hpp"

// constants that enumerate star formation rate prescriptions
enum class SFRFunc {constant, exponential};

//----------------------------------------------------------------------------------------
//! \class StarFormationDriver
//  \brief owns the StarFormationHistory and fills one step of it per call to
//  FormStars().  Step 0 is the initial state; stars form from step 1 on.

class StarFormationDriver {
 public:
  StarFormationDriver(ParameterInput *pin, const snia::TimeGrid &grid,
                      const stellar::IMF &imf);

  std::vector<Real> mbin_edges;      // mass bin edges [Msun], nbins+1 entries
  snia::StarFormationHistory sfh;
  DualArray1D<Real> mbin_mass_frac;  // fraction of formed mass in each bin

  Real SFR(Real time) const;
  // fills sfr, mstar, mstar_tot of step tstep; returns WD mass formed in the step
  Real FormStars(int tstep);

  Real sfr_now() const { return sfr_now_; }
  Real mstar_tot() const { return mstar_tot_; }
  Real wd_mass_fraction() const { return wd_mass_frac_; }

 private:
  snia::TimeGrid grid_;
  SFRFunc sfr_func_;
  Real sfr0_, tau_;
  Real wd_mass_frac_;   // WD mass per unit stellar mass formed
  Real sfr_now_ = 0.0;
  Real mstar_tot_ = 0.0;
};

#endif // SFH_STAR_FORMATION_HPP_

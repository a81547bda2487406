#ifndef SNIA_SNIA_EVENTS_HPP_
#define SNIA_SNIA_EVENTS_HPP_
//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file snia_events.hpp
//  \brief per-step SNIa event count for a DTDKernel, and the simulation state it reads

#include "chemevo.hpp"
#include "snia_dtd.hpp"

namespace snia {

//----------------------------------------------------------------------------------------
//! \struct StarFormationHistory
//  \brief per-step history written by the outer loop and read by SNIaEvents().
//  Entries up to and including the current step must be filled before each call.

struct StarFormationHistory {
  StarFormationHistory(int nsteps, int nbins, Real snia_mass = 1.374);

  DvceArray2D<Real> mstar;      // mass formed in step i in mass bin b, (nsteps,nbins)
  DvceArray1D<Real> sfr;        // star formation rate in step i [Msun/Myr]
  DvceArray1D<Real> mstar_tot;  // cumulative stellar mass at step i [Msun]
  Real snia_mass;               // mass released per SNIa [Msun]

  int nsteps() const { return static_cast<int>(sfr.extent(0)); }
  int nbins() const { return static_cast<int>(mstar.extent(1)); }
};

//----------------------------------------------------------------------------------------
//! \class WDReservoir
//  \brief white-dwarf mass per formation step that has not yet exploded.  Used by the
//  exponential model only; SNIaEvents() is the only function that depletes it.

class WDReservoir {
 public:
  explicit WDReservoir(int nsteps);

  void Deposit(int tstep, Real mass);
  Real Mass(int tstep) const;
  Real TotalMass() const;
  HostArray1D<Real> HostCopy() const;
  int size() const { return static_cast<int>(mwd_.extent(0)); }

  friend Real SNIaEvents(const DTDKernel &kernel, int tstep,
                         const StarFormationHistory &sfh, WDReservoir &reservoir);

 private:
  DvceArray1D<Real> mwd_;
};

// Expected number of SNIa in step tstep.  For the exponential model the reservoir is
// decayed in place after the count is taken; all other models leave it untouched.
// Throws std::out_of_range if tstep is outside [0, nsteps).
Real SNIaEvents(const DTDKernel &kernel, int tstep, const StarFormationHistory &sfh,
                WDReservoir &reservoir);

} // namespace snia
#endif // SNIA_SNIA_EVENTS_HPP_

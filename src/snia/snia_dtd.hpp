#ifndef SNIA_SNIA_DTD_HPP_
#define SNIA_SNIA_DTD_HPP_
//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file snia_dtd.hpp
//  \brief definitions for the Type Ia supernova delay-time distribution (DTD) kernels.
//  A DTDKernel is built once at setup by BuildDTD() and is read-only afterwards; the
//  per-step event count is computed by SNIaEvents() in snia_events.hpp.

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "chemevo.hpp"
#include "parameter_input.hpp"
#include "stellar/imf.hpp"
#include "stellar/lifetime.hpp"

namespace snia {

// constants that enumerate DTD models
enum class SNIaDTDModel {exponential, power_law, prompt_delayed, single_degenerate};

//----------------------------------------------------------------------------------------
//! \class InvalidParameterError
//  \brief unknown model name, unknown keyword, or unusable parameter value

class InvalidParameterError : public std::runtime_error {
 public:
  explicit InvalidParameterError(const std::string &msg) : std::runtime_error(msg) {}
};

//----------------------------------------------------------------------------------------
//! \class NormalizationError
//  \brief a kernel normalization would divide by zero or produce NaN/Inf

class NormalizationError : public std::runtime_error {
 public:
  explicit NormalizationError(const std::string &msg) : std::runtime_error(msg) {}
};

//----------------------------------------------------------------------------------------
//! \struct TimeGrid
//  \brief uniform time grid t[i] = i*dt (Myr), i = 0..nsteps-1

struct TimeGrid {
  Real dt;
  int nsteps;
  Real Time(int i) const { return static_cast<Real>(i)*dt; }
  Real TimeTot() const { return static_cast<Real>(nsteps - 1)*dt; }
};

// keyword -> value, values in the same text form as in the input file
using DTDParameters = std::map<std::string, std::string>;

//----------------------------------------------------------------------------------------
// parameter records of each model, initialized to the documented defaults

struct ExponentialDTD {
  Real min_snia_time = 150.0;  // Myr
  Real timescale = 1500.0;     // Myr
  Real snia_fraction = 0.078;  // fraction of WD mass that ends up as SNIa
  Real dmwd = 0.0;             // fractional reservoir decay per step, dt/timescale
};

struct PowerLawDTD {
  Real min_snia_time = 40.0;
  Real nia_per_mstar = 2.2e-3;  // SNIa per Msun formed within 10 Gyr
  Real slope = -1.0;
};

struct PromptDelayedDTD {
  Real a = 4.4e-8;   // delayed coefficient, per Msun of stars per Myr
  Real b = 2.6e3;    // prompt coefficient, per (Msun/Myr) of star formation per Myr
  Real min_snia_time = 40.0;
};

struct SingleDegenerateDTD {
  Real a = 5.0e-4;   // realization probability of the SD channel
  Real gam = 2.0;    // slope of the mass-ratio distribution
  Real eps = 1.0;    // accretion efficiency of the secondary envelope
  bool normalize = false;
  Real nia_per_mstar = 1.54e-3;
};

//----------------------------------------------------------------------------------------
//! \struct StellarPhysics
//  \brief IMF and lifetime inversion consumed by the single-degenerate derivation

struct StellarPhysics {
  stellar::IMF imf = stellar::IMF::Kroupa();
  stellar::MassFromLifetimeFn mass_from_lifetime = &stellar::MassFromLifetime;
};

//----------------------------------------------------------------------------------------
//! \struct SingleDegenerateGrid
//  \brief 1 Myr resolution arrays of the single-degenerate derivation.
//  Coarse bin j of the kernel is the sum of ria1 over [bin_edges[j], bin_edges[j+1]).

struct SingleDegenerateGrid {
  HostArray1D<Real> t2;      // fine time grid, 29 Myr .. t[nsteps-1]
  HostArray1D<Real> m2;      // secondary mass
  HostArray1D<Real> m1low;   // minimum primary mass
  HostArray1D<Real> nm2;     // secondary mass distribution
  HostArray1D<Real> ria1;    // fine-grid SNIa rate
  std::vector<int> bin_edges;
};

//----------------------------------------------------------------------------------------
//! \class DTDKernel
//  \brief immutable parameterization of one DTD model on a fixed time grid

class DTDKernel {
 public:
  SNIaDTDModel model() const { return model_; }
  const TimeGrid &grid() const { return grid_; }
  const ExponentialDTD &exponential() const { return exp_; }
  const PowerLawDTD &power_law() const { return plaw_; }
  const PromptDelayedDTD &prompt_delayed() const { return pdel_; }
  const SingleDegenerateDTD &single_degenerate() const { return sdeg_; }
  const SingleDegenerateGrid &single_degenerate_grid() const { return sd_grid_; }

  // SNIa per Msun formed, indexed by steps since formation.  Length nsteps for
  // power_law, nsteps-1 for single_degenerate, empty otherwise.
  const DualArray1D<Real> &ria() const { return ria_; }
  int nria() const { return static_cast<int>(ria_.extent(0)); }
  Real Ria(int i) const { return ria_.h_view(i); }

  // ceil(min_snia_time/dt) for models with a minimum delay, 0 otherwise
  int MinDelaySteps() const;

  friend DTDKernel BuildDTD(SNIaDTDModel model, const DTDParameters &params,
                            const TimeGrid &grid, const StellarPhysics &physics);

 private:
  DTDKernel(SNIaDTDModel model, const TimeGrid &grid);

  SNIaDTDModel model_;
  TimeGrid grid_;
  ExponentialDTD exp_;
  PowerLawDTD plaw_;
  PromptDelayedDTD pdel_;
  SingleDegenerateDTD sdeg_;
  SingleDegenerateGrid sd_grid_;
  DualArray1D<Real> ria_;

  void BuildPowerLaw();
  void BuildSingleDegenerate(const StellarPhysics &physics);
  void RebinSingleDegenerate();
  void SyncRia();
};

// model names <-> tags; unknown names throw InvalidParameterError
SNIaDTDModel ParseDTDModel(const std::string &name);
std::string DTDModelName(SNIaDTDModel model);

// keywords accepted by each model, and the help text listing all of them
const std::vector<std::string> &ValidKeywords(SNIaDTDModel model);
std::string ValidKeywordsMessage();

DTDKernel BuildDTD(SNIaDTDModel model, const DTDParameters &params, const TimeGrid &grid,
                   const StellarPhysics &physics = StellarPhysics());
DTDKernel BuildDTD(const std::string &model_name, const DTDParameters &params,
                   const TimeGrid &grid, const StellarPhysics &physics = StellarPhysics());

// reads block <snia_dtd>: "func" selects the model, every other entry is a keyword
DTDKernel BuildDTD(ParameterInput *pin, const TimeGrid &grid,
                   const StellarPhysics &physics = StellarPhysics());

} // namespace snia
#endif // SNIA_SNIA_DTD_HPP_

//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file snia_events.cpp
//  \brief implementation of SNIaEvents(), the white-dwarf reservoir and the star
//  formation history container

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "chemevo.hpp"
#include "snia_dtd.hpp"
#include "snia_events.hpp"

namespace snia {

namespace {
//----------------------------------------------------------------------------------------
// exponential: a fraction dMwd of every reservoir entry old enough explodes each step

Real ExponentialEvents(const DTDKernel &kernel, int tstep, const StarFormationHistory &sfh,
                       DvceArray1D<Real> mwd) {
  int ind_min_t = tstep - kernel.MinDelaySteps();
  if (ind_min_t <= 0) return 0.0;

  Real dmwd = kernel.exponential().dmwd;
  Real snia_mass = sfh.snia_mass;

  // count from the reservoir as it was before this step's decay
  Real count = 0.0;
  Kokkos::parallel_reduce("snia_exp_count",
                          Kokkos::RangePolicy<>(DevExeSpace(), 0, ind_min_t+1),
  KOKKOS_LAMBDA(const int i, Real &sum) {
    sum += mwd(i)*dmwd/snia_mass;
  }, Kokkos::Sum<Real>(count));

  par_for("snia_exp_decay", DevExeSpace(), 0, ind_min_t, KOKKOS_LAMBDA(const int i) {
    mwd(i) *= (1.0 - dmwd);
  });
  return count;
}

//----------------------------------------------------------------------------------------
// power_law and single_degenerate: causal convolution of ria with the mass formed,
// population formed i steps ago contributes ria(i)

Real ConvolutionEvents(const DTDKernel &kernel, int tstep,
                       const StarFormationHistory &sfh) {
  auto ria = kernel.ria().d_view;
  auto mstar = sfh.mstar;
  const int nbins = sfh.nbins();
  const int nconv = std::min(tstep, kernel.nria());

  Real count = 0.0;
  Kokkos::parallel_reduce("snia_convolve", Kokkos::RangePolicy<>(DevExeSpace(), 0, nconv),
  KOKKOS_LAMBDA(const int i, Real &sum) {
    Real mformed = 0.0;
    for (int b = 0; b < nbins; ++b) {
      mformed += mstar(tstep-i, b);
    }
    sum += ria(i)*mformed;
  }, Kokkos::Sum<Real>(count));
  return count;
}

//----------------------------------------------------------------------------------------
// prompt_delayed: B*sfr(t - min_snia_time) + A*mstar_tot(t), times dt

Real PromptDelayedEvents(const DTDKernel &kernel, int tstep,
                         const StarFormationHistory &sfh) {
  int ind = tstep - kernel.MinDelaySteps();
  Real a = kernel.prompt_delayed().a;
  Real b = kernel.prompt_delayed().b;
  auto sfr = sfh.sfr;
  auto mstar_tot = sfh.mstar_tot;

  Real rate = 0.0;
  Kokkos::parallel_reduce("snia_prompt_delayed",
                          Kokkos::RangePolicy<>(DevExeSpace(), 0, 1),
  KOKKOS_LAMBDA(const int, Real &sum) {
    Real prompt = (ind > 0) ? sfr(ind)*b : 0.0;
    Real delayed = mstar_tot(tstep)*a;
    sum += prompt + delayed;
  }, Kokkos::Sum<Real>(rate));
  return rate*kernel.grid().dt;
}
} // namespace

//----------------------------------------------------------------------------------------
// StarFormationHistory constructor, all entries start at zero

StarFormationHistory::StarFormationHistory(int nsteps, int nbins, Real mass_per_snia) :
  mstar("mstar", nsteps, nbins),
  sfr("sfr", nsteps),
  mstar_tot("mstar_tot", nsteps),
  snia_mass(mass_per_snia) {
}

//----------------------------------------------------------------------------------------
// WDReservoir

WDReservoir::WDReservoir(int nsteps) : mwd_("Mwd_Ia", nsteps) {
}

void WDReservoir::Deposit(int tstep, Real mass) {
  if (tstep < 0 || tstep >= size()) {
    std::stringstream msg;
    msg << "WDReservoir::Deposit step " << tstep << " outside [0, " << size() << ")";
    throw std::out_of_range(msg.str());
  }
  auto mwd = mwd_;
  par_for("wd_deposit", DevExeSpace(), tstep, tstep, KOKKOS_LAMBDA(const int i) {
    mwd(i) += mass;
  });
}

Real WDReservoir::Mass(int tstep) const {
  Real mass = 0.0;
  Kokkos::deep_copy(mass, Kokkos::subview(mwd_, tstep));
  return mass;
}

Real WDReservoir::TotalMass() const {
  auto mwd = mwd_;
  Real total = 0.0;
  Kokkos::parallel_reduce("wd_total", Kokkos::RangePolicy<>(DevExeSpace(), 0, size()),
  KOKKOS_LAMBDA(const int i, Real &sum) {
    sum += mwd(i);
  }, Kokkos::Sum<Real>(total));
  return total;
}

HostArray1D<Real> WDReservoir::HostCopy() const {
  HostArray1D<Real> host("Mwd_Ia_host", size());
  Kokkos::deep_copy(host, mwd_);
  return host;
}

//----------------------------------------------------------------------------------------
//! \fn Real SNIaEvents()
//! \brief expected number of SNIa in step tstep for the model of the kernel

Real SNIaEvents(const DTDKernel &kernel, int tstep, const StarFormationHistory &sfh,
                WDReservoir &reservoir) {
  if (tstep < 0 || tstep >= kernel.grid().nsteps || tstep >= sfh.nsteps()) {
    std::stringstream msg;
    msg << "SNIaEvents step " << tstep << " outside [0, " << kernel.grid().nsteps << ")";
    throw std::out_of_range(msg.str());
  }

  switch (kernel.model()) {
    case SNIaDTDModel::exponential:
      if (tstep >= reservoir.size()) {
        std::stringstream msg;
        msg << "SNIaEvents step " << tstep << " beyond WD reservoir of size "
            << reservoir.size();
        throw std::out_of_range(msg.str());
      }
      return ExponentialEvents(kernel, tstep, sfh, reservoir.mwd_);
    case SNIaDTDModel::power_law:
    case SNIaDTDModel::single_degenerate:
      return ConvolutionEvents(kernel, tstep, sfh);
    case SNIaDTDModel::prompt_delayed:
      return PromptDelayedEvents(kernel, tstep, sfh);
  }
  return 0.0;
}

} // namespace snia

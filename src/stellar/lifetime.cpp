//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file lifetime.cpp
//  \brief stellar lifetimes from Padovani & Matteucci (1993, ApJ 416, 26):
//    tau = 10^[(1.338 - sqrt(1.790 - 0.2232 (7.764 - log m)))/0.1116] yr   m <= 6.6
//    tau = 1.2 m^-1.85 + 0.003 Gyr                                         m >  6.6
//  The two branches meet at tau ~ 40 Myr.

#include <cmath>

#include "chemevo.hpp"
#include "lifetime.hpp"

namespace stellar {

namespace {
constexpr Real kMassBreak = 6.6;      // Msun, boundary of the two fits
constexpr Real kTimeBreak = 40.0;     // Myr, lifetime at the boundary
constexpr Real kMassMax = 100.0;      // Msun
}

Real Lifetime(Real mass) {
  if (mass > kMassBreak) {
    return 1.0e3*(1.2*std::pow(mass, -1.85) + 0.003);
  }
  Real logm = std::log10(mass);
  // fit is undefined below ~0.56 Msun; those stars live longer than a Hubble time
  Real arg = std::fmax(1.790 - 0.2232*(7.764 - logm), 0.0);
  Real logt = (1.338 - std::sqrt(arg))/0.1116;
  return std::pow(10.0, logt)*1.0e-6;
}

Real MassFromLifetime(Real t_myr) {
  if (t_myr > kTimeBreak) {
    Real logt = std::log10(t_myr*1.0e6);
    Real logm = 7.764 - (1.790 - SQR(1.338 - 0.1116*logt))/0.2232;
    return std::pow(10.0, logm);
  }
  // lifetimes shorter than the 3 Myr asymptote are reached by no star
  Real t_gyr = t_myr*1.0e-3 - 0.003;
  if (t_gyr <= 0.0) return kMassMax;
  return std::fmin(std::pow(1.2/t_gyr, 1.0/1.85), kMassMax);
}

} // namespace stellar

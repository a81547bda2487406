#ifndef STELLAR_LIFETIME_HPP_
#define STELLAR_LIFETIME_HPP_
//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file lifetime.hpp
//  \brief Padovani & Matteucci (1993) main-sequence lifetimes and their inverse

#include "chemevo.hpp"

namespace stellar {

// signature of functions returning the mass [Msun] of stars with lifetime t [Myr]
using MassFromLifetimeFn = Real (*)(Real t_myr);

// lifetime in Myr of a star of mass m in Msun
Real Lifetime(Real mass);

// mass in Msun of a star whose lifetime is t Myr
Real MassFromLifetime(Real t_myr);

} // namespace stellar
#endif // STELLAR_LIFETIME_HPP_

//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file show_config.cpp
//  \brief ShowConfig(), prints the configure-time options of this executable

#include <iostream>

#include "chemevo.hpp"
#include "utils.hpp"

//----------------------------------------------------------------------------------------
//! \fn void ShowConfig()
//  \brief prints version, floating point precision, Kokkos spaces and MPI support

void ShowConfig() {
  std::cout << "chemevo version " << CHEMEVO_VERSION << std::endl;
  std::cout << "This code was configured with:" << std::endl;
  std::cout << "  Floating-point precision:   "
            << ((sizeof(Real) == sizeof(double)) ? "double" : "single") << std::endl;
  std::cout << "  Kokkos version:             " << KOKKOS_VERSION << std::endl;
  std::cout << "  Kokkos device exec space:   " << DevExeSpace::name() << std::endl;
  std::cout << "  Kokkos host exec space:     " << HostExeSpace::name() << std::endl;
#if MPI_PARALLEL_ENABLED
  std::cout << "  MPI parallelism:            ON" << std::endl;
#else
  std::cout << "  MPI parallelism:            OFF" << std::endl;
#endif
  return;
}

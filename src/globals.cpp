//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file globals.cpp
//  \brief global variables are wrapped in their own namespace. Defaults describe a
//  serial run, so library code and unit tests log as rank 0 without calling main().

#include "chemevo.hpp"
#include "globals.hpp"

namespace global_variable {
int my_rank = 0;   // MPI rank of this process; reset at start of main()
int nranks = 1;    // total number of MPI ranks; reset at start of main()
}

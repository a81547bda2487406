//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file snia_history.cpp
//  \brief writes the SNIa history file, one formatted row per step

#include <cstdio>      // fopen(), fprintf(), fclose()
#include <cstdlib>
#include <iostream>
#include <string>

#include "chemevo.hpp"
#include "globals.hpp"
#include "parameter_input.hpp"
#include "snia_history.hpp"

//----------------------------------------------------------------------------------------
// ctor: creates (or truncates) the file and writes the header on rank 0

SNIaHistoryOutput::SNIaHistoryOutput(ParameterInput *pin, const std::string &dtd_func) :
  pfile_(nullptr), cum_n_snia_(0.0) {
  fname_.assign(pin->GetOrAddString("job", "basename", "chemevo"));
  fname_.append(".snia.hst");
  if (global_variable::my_rank != 0) return;

  if ((pfile_ = std::fopen(fname_.c_str(), "w")) == nullptr) {
    std::cout << "### FATAL ERROR in " << __FILE__ << " at line " << __LINE__
              << std::endl << "Output file '" << fname_ << "' could not be opened"
              << std::endl;
    std::exit(EXIT_FAILURE);
  }
  std::fprintf(pfile_, "# chemevo SNIa history data  dtd_func=%s\n", dtd_func.c_str());
  std::fprintf(pfile_, "# [1]=step [2]=time [3]=sfr [4]=mstar_tot [5]=n_snia "
                       "[6]=m_snia [7]=cum_n_snia\n");
}

SNIaHistoryOutput::~SNIaHistoryOutput() {
  if (pfile_ != nullptr) std::fclose(pfile_);
}

//----------------------------------------------------------------------------------------
//! \fn void SNIaHistoryOutput::WriteStep()
//! \brief appends the row of one step; m_snia = n_snia*snia_mass

void SNIaHistoryOutput::WriteStep(int step, Real time, Real sfr, Real mstar_tot,
                                  Real n_snia, Real snia_mass) {
  cum_n_snia_ += n_snia;
  if (pfile_ == nullptr) return;
  std::fprintf(pfile_, "%d %e %e %e %e %e %e\n", step, time, sfr, mstar_tot, n_snia,
               n_snia*snia_mass, cum_n_snia_);
  std::fflush(pfile_);
}

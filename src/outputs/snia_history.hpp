#ifndef OUTPUTS_SNIA_HISTORY_HPP_
#define OUTPUTS_SNIA_HISTORY_HPP_
//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file snia_history.hpp
//  \brief formatted table of per-step SNIa counts, "<basename>.snia.hst"

#include <cstdio>
#include <string>

#include "chemevo.hpp"
#include "parameter_input.hpp"

//----------------------------------------------------------------------------------------
//! \class SNIaHistoryOutput
//  \brief opens the history file on rank 0 and appends one row per step.  Other ranks
//  hold no file and WriteStep() is a no-op there.

class SNIaHistoryOutput {
 public:
  SNIaHistoryOutput(ParameterInput *pin, const std::string &dtd_func);
  ~SNIaHistoryOutput();
  SNIaHistoryOutput(const SNIaHistoryOutput &) = delete;
  SNIaHistoryOutput &operator=(const SNIaHistoryOutput &) = delete;

  void WriteStep(int step, Real time, Real sfr, Real mstar_tot, Real n_snia,
                 Real snia_mass);
  const std::string &filename() const { return fname_; }
  Real cum_n_snia() const { return cum_n_snia_; }

 private:
  std::string fname_;
  FILE *pfile_;
  Real cum_n_snia_;
};

#endif // OUTPUTS_SNIA_HISTORY_HPP_

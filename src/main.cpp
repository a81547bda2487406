//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file main.cpp
//  \brief chemevo main program
//
// Runs a prescribed star formation history forward on a uniform time grid and counts
// the Type Ia supernovae of every step with the delay-time distribution selected in the
// <snia_dtd> block of the input file.  Steps:
//   - parse command line and input file
//   - build the DTD kernel and the star formation history
//   - loop over steps, forming stars and counting SNIa
//   - write the SNIa history file

#include <cmath>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "chemevo.hpp"
#include "globals.hpp"
#include "parameter_input.hpp"
#include "outputs/snia_history.hpp"
#include "sfh/star_formation.hpp"
#include "snia/snia_dtd.hpp"
#include "snia/snia_events.hpp"
#include "stellar/imf.hpp"
#include "stellar/lifetime.hpp"
#include "utils/utils.hpp"

#if MPI_PARALLEL_ENABLED
#include <mpi.h>
#endif

namespace {
//----------------------------------------------------------------------------------------
// integrates the model over all steps of the grid

void RunEvolution(ParameterInput *pin) {
  snia::TimeGrid grid;
  grid.dt = pin->GetOrAddReal("time", "dt", 30.0);
  Real time_tot = pin->GetOrAddReal("time", "time_tot", 12000.0);
  if (!(grid.dt > 0.0) || time_tot < grid.dt) {
    throw snia::InvalidParameterError("<time> requires dt > 0 and time_tot >= dt");
  }
  grid.nsteps = static_cast<int>(std::lround(time_tot/grid.dt)) + 1;

  std::string imf_name = pin->GetOrAddString("imf", "imf", "kroupa");
  Real m_low = pin->GetOrAddReal("imf", "mbins_low", 0.1);
  Real m_up = pin->GetOrAddReal("imf", "mbins_high", 100.0);
  snia::StellarPhysics physics;
  physics.imf = stellar::MakeIMF(imf_name, m_low, m_up);
  physics.mass_from_lifetime = &stellar::MassFromLifetime;

  snia::DTDKernel kernel = snia::BuildDTD(pin, grid, physics);
  StarFormationDriver driver(pin, grid, physics.imf);
  snia::WDReservoir reservoir(grid.nsteps);
  SNIaHistoryOutput hist(pin, snia::DTDModelName(kernel.model()));

  bool deposit_wd = (kernel.model() == snia::SNIaDTDModel::exponential);
  Real snia_fraction = kernel.exponential().snia_fraction;

  // step 0 is the initial state, nothing has formed yet
  hist.WriteStep(0, 0.0, 0.0, 0.0, 0.0, driver.sfh.snia_mass);
  for (int n = 1; n < grid.nsteps; ++n) {
    Real mwd = driver.FormStars(n);
    if (deposit_wd) reservoir.Deposit(n, mwd*snia_fraction);
    Real nsnia = snia::SNIaEvents(kernel, n, driver.sfh, reservoir);
    hist.WriteStep(n, grid.Time(n), driver.sfr_now(), driver.mstar_tot(), nsnia,
                   driver.sfh.snia_mass);
  }

  if (global_variable::my_rank == 0) {
    std::cout << std::endl << "Evolution complete: " << grid.nsteps - 1 << " steps to t = "
              << grid.TimeTot() << " Myr" << std::endl;
    std::cout << "  total stellar mass formed = " << driver.mstar_tot() << " Msun"
              << std::endl;
    std::cout << "  total number of SNIa      = " << hist.cum_n_snia() << std::endl;
    if (deposit_wd) {
      std::cout << "  WD mass left in reservoir = " << reservoir.TotalMass() << " Msun"
                << std::endl;
    }
    std::cout << "  history written to '" << hist.filename() << "'" << std::endl;
  }
}
} // namespace

//----------------------------------------------------------------------------------------
//! \fn int main(int argc, char *argv[])
//  \brief chemevo main program

int main(int argc, char *argv[]) {
  std::string input_file, run_dir;
  bool iarg_flag = false;  // set to true if -i <file> on cmdline
  bool narg_flag = false;  // set to true if -n argument on cmdline

  //--- Step 1. --------------------------------------------------------------------------
  // Initialize environment (must initialize MPI first, then Kokkos)

#if MPI_PARALLEL_ENABLED
  if (MPI_SUCCESS != MPI_Init(&argc, &argv)) {
    std::cout << "### FATAL ERROR in " << __FILE__ << " at line " << __LINE__ << std::endl
              << "MPI Initialization failed." << std::endl;
    return(EXIT_FAILURE);
  }
  MPI_Comm_rank(MPI_COMM_WORLD, &(global_variable::my_rank));
  MPI_Comm_size(MPI_COMM_WORLD, &(global_variable::nranks));
#else
  global_variable::my_rank = 0;
  global_variable::nranks = 1;
#endif
  Kokkos::initialize(argc, argv);

  //--- Step 2. --------------------------------------------------------------------------
  // Check for command line options and respond.

  for (int i=1; i<argc; i++) {
    // If argv[i] is a 2 character string of the form "-?" then:
    if (*argv[i] == '-'  && *(argv[i]+1) != '\0' && *(argv[i]+2) == '\0') {
      // check that command line options that require arguments actually have them:
      char opt_letter = *(argv[i]+1);
      switch(opt_letter) {
        case 'd':
        case 'i':
          if ((i+1 >= argc) || (*argv[i+1] == '-') ) {
            if (global_variable::my_rank == 0) {
              std::cout << "### FATAL ERROR in main" << std::endl
                        << "-" << opt_letter << " must be followed by a valid argument"
                        << std::endl;
            }
            Kokkos::finalize();
#if MPI_PARALLEL_ENABLED
            MPI_Finalize();
#endif
            return(EXIT_FAILURE);
          }
        default:
          break;
      }
      switch(*(argv[i]+1)) {
        case 'i':                      // -i <input_file>
          input_file.assign(argv[++i]);
          iarg_flag = true;
          break;
        case 'd':                      // -d <run_directory>
          run_dir.assign(argv[++i]);
          break;
        case 'n':
          narg_flag = true;
          break;
        case 'c':
          if (global_variable::my_rank == 0) ShowConfig();
          Kokkos::finalize();
#if MPI_PARALLEL_ENABLED
          MPI_Finalize();
#endif
          return(EXIT_SUCCESS);
          break;
        case 'h':
        default:
          if (global_variable::my_rank == 0) {
            std::cout << "chemevo version " << CHEMEVO_VERSION << std::endl;
            std::cout << "Usage: " << argv[0] << " [options] [block/par=value ...]\n";
            std::cout << "Options:" << std::endl;
            std::cout << "  -i <file>       specify input file [required]\n";
            std::cout << "  -d <directory>  specify run dir [current dir]\n";
            std::cout << "  -n              parse input file and quit\n";
            std::cout << "  -c              show configuration and quit\n";
            std::cout << "  -h              this help\n";
            ShowConfig();
          }
          Kokkos::finalize();
#if MPI_PARALLEL_ENABLED
          MPI_Finalize();
#endif
          return(EXIT_SUCCESS);
          break;
      }
    } // else if argv[i] not of form "-?" ignore it here (tested in ModifyFromCmdline)
  }

  if (!(iarg_flag)) {
    if (global_variable::my_rank == 0) {
      std::cout << "### FATAL ERROR in main" << std::endl
                << "No input file specified, use -i <file> or -h for help" << std::endl;
    }
    Kokkos::finalize();
#if MPI_PARALLEL_ENABLED
    MPI_Finalize();
#endif
    return(EXIT_FAILURE);
  }

  int status = EXIT_SUCCESS;
  {
    //--- Step 3. ------------------------------------------------------------------------
    // Construct ParameterInput, read input file, apply command line overrides.

    auto pinput = std::make_unique<ParameterInput>();
    pinput->LoadFromFile(input_file);
    pinput->ModifyFromCmdline(argc, argv);

    if (narg_flag) {
      if (global_variable::my_rank == 0) pinput->ParameterDump(std::cout);
    } else {
      ChangeRunDir(run_dir);

      //--- Step 4. ----------------------------------------------------------------------
      // Build the DTD and evolve.  Parameter and normalization errors are fatal.

      try {
        RunEvolution(pinput.get());
      } catch(const snia::InvalidParameterError &e) {
        std::cout << "### FATAL ERROR in main" << std::endl
                  << "invalid parameter: " << e.what() << std::endl;
        status = EXIT_FAILURE;
      } catch(const snia::NormalizationError &e) {
        std::cout << "### FATAL ERROR in main" << std::endl
                  << "DTD normalization failed: " << e.what() << std::endl;
        status = EXIT_FAILURE;
      } catch(const std::exception &e) {
        std::cout << "### FATAL ERROR in main" << std::endl << e.what() << std::endl;
        status = EXIT_FAILURE;
      }

      //--- Step 5. ----------------------------------------------------------------------
      // Dump final parameters so the run can be reproduced

      if (status == EXIT_SUCCESS && global_variable::my_rank == 0) {
        std::cout << std::endl << "Parameters used in this run:" << std::endl;
        pinput->ParameterDump(std::cout);
      }
    }
  }

  Kokkos::finalize();
#if MPI_PARALLEL_ENABLED
  MPI_Finalize();
#endif
  return(status);
}

//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file change_rundir.cpp
//  \brief ChangeRunDir(), moves the run so the history file lands in its own directory

#include <sys/stat.h>  // mkdir, stat
#include <unistd.h>    // chdir

#include <cerrno>
#include <cstdlib>
#include <cstring>     // strerror
#include <iostream>
#include <string>

#include "globals.hpp"
#include "utils.hpp"

//----------------------------------------------------------------------------------------
//! \fn void ChangeRunDir(const std::string dir)
//  \brief enters run directory dir, creating it on rank 0 if needed.  An existing path
//  that is not a directory, or one that cannot be created or entered, is fatal.

void ChangeRunDir(const std::string dir) {
  if (dir.empty()) return;

  struct stat sb;
  bool exists = (stat(dir.c_str(), &sb) == 0);
  if (exists && !S_ISDIR(sb.st_mode)) {
    std::cout << "### FATAL ERROR in " << __FILE__ << " at line " << __LINE__ << std::endl
              << "Run directory '" << dir << "' exists and is not a directory"
              << std::endl;
    std::exit(EXIT_FAILURE);
  }
  if (!exists && global_variable::my_rank == 0) {
    if (mkdir(dir.c_str(), 0775) != 0 && errno != EEXIST) {
      std::cout << "### FATAL ERROR in " << __FILE__ << " at line " << __LINE__
                << std::endl << "Cannot create run directory '" << dir << "': "
                << std::strerror(errno) << std::endl;
      std::exit(EXIT_FAILURE);
    }
  }

  if (chdir(dir.c_str()) != 0) {
    std::cout << "### FATAL ERROR in " << __FILE__ << " at line " << __LINE__ << std::endl
              << "Cannot cd to directory '" << dir << "': " << std::strerror(errno)
              << std::endl;
    std::exit(EXIT_FAILURE);
  }
  if (global_variable::my_rank == 0) {
    std::cout << "Run directory: " << dir << (exists ? "" : " (created)") << std::endl;
  }
  return;
}

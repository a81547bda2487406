#ifndef UTILS_UTILS_HPP_
#define UTILS_UTILS_HPP_
//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file utils.hpp
//  \brief prototypes of small functions used by main()

#include <string>

void ShowConfig();
void ChangeRunDir(const std::string dir);

#endif // UTILS_UTILS_HPP_

#ifndef CHEMEVO_HPP_
#define CHEMEVO_HPP_
//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file chemevo.hpp
//  \brief contains typedefs, Kokkos array aliases and the par_for wrapper used throughout
//  the chemical evolution code

#include <string>

#include <Kokkos_Core.hpp>
#include <Kokkos_DualView.hpp>

#include "config.hpp"

using Real = double;

// Execution and memory spaces
using DevExeSpace = Kokkos::DefaultExecutionSpace;
using DevMemSpace = Kokkos::DefaultExecutionSpace::memory_space;
using HostExeSpace = Kokkos::DefaultHostExecutionSpace;
using HostMemSpace = Kokkos::HostSpace;
using LayoutWrapper = Kokkos::LayoutRight;

// arrays on device
template <typename T>
using DvceArray1D = Kokkos::View<T *, LayoutWrapper, DevMemSpace>;
template <typename T>
using DvceArray2D = Kokkos::View<T **, LayoutWrapper, DevMemSpace>;

// arrays on host
template <typename T>
using HostArray1D = Kokkos::View<T *, LayoutWrapper, HostMemSpace>;

// dual arrays, filled on host and synced to device
template <typename T>
using DualArray1D = Kokkos::DualView<T *, LayoutWrapper, DevMemSpace>;

#define SQR(x) ( (x)*(x) )

//----------------------------------------------------------------------------------------
// wrapper for Kokkos::parallel_for; upper index is inclusive, as in the rest of the code

template <typename ExeSpace, typename Function>
inline void par_for(const std::string &name, ExeSpace exec_space,
                    const int &il, const int &iu, const Function &function) {
  Kokkos::parallel_for(name, Kokkos::RangePolicy<ExeSpace>(exec_space, il, iu+1),
                       function);
}

#endif // CHEMEVO_HPP_

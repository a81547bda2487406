//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file snia_dtd.cpp
//  \brief model selection, keyword validation and construction of the exponential,
//  power-law and prompt+delayed SNIa DTD kernels.  The single-degenerate kernel is
//  built in snia_single_degenerate.cpp.

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "chemevo.hpp"
#include "globals.hpp"
#include "parameter_input.hpp"
#include "snia_dtd.hpp"

namespace snia {

namespace {
//----------------------------------------------------------------------------------------
// conversion of keyword values; anything that is not entirely a number is rejected

Real ParseReal(const DTDParameters &params, const std::string &name, Real def_value) {
  auto it = params.find(name);
  if (it == params.end()) return def_value;
  const std::string &text = it->second;
  char *end = nullptr;
  Real value = std::strtod(text.c_str(), &end);
  while (end != nullptr && (*end == ' ' || *end == '\t')) ++end;
  if (text.empty() || end == text.c_str() || *end != '\0' || !std::isfinite(value)) {
    throw InvalidParameterError("SNIa DTD keyword '" + name + "' = '" + text +
                                "' is not a finite real number");
  }
  return value;
}

bool ParseBool(const DTDParameters &params, const std::string &name, bool def_value) {
  auto it = params.find(name);
  if (it == params.end()) return def_value;
  bool value = def_value;
  if (!ParameterInput::ParseBoolean(it->second, value)) {
    throw InvalidParameterError("SNIa DTD keyword '" + name + "' = '" + it->second +
                                "' is not a boolean");
  }
  return value;
}

void RequireNonNegative(SNIaDTDModel model, const std::string &name, Real value) {
  if (value < 0.0) {
    std::stringstream msg;
    msg << DTDModelName(model) << " DTD requires " << name << " >= 0 (" << name << " = "
        << value << ")";
    throw InvalidParameterError(msg.str());
  }
}

void ValidateKeywords(SNIaDTDModel model, const DTDParameters &params) {
  const std::vector<std::string> &valid = ValidKeywords(model);
  for (const auto &kv : params) {
    bool found = false;
    for (const auto &v : valid) {
      if (kv.first.compare(v) == 0) found = true;
    }
    if (!found) {
      std::stringstream msg;
      msg << "Keyword '" << kv.first << "' is not valid for SNIa DTD model '"
          << DTDModelName(model) << "'" << std::endl << ValidKeywordsMessage();
      throw InvalidParameterError(msg.str());
    }
  }
}
} // namespace

//----------------------------------------------------------------------------------------
// model names

SNIaDTDModel ParseDTDModel(const std::string &name) {
  if (name.compare("exponential") == 0) {
    return SNIaDTDModel::exponential;
  } else if (name.compare("power_law") == 0) {
    return SNIaDTDModel::power_law;
  } else if (name.compare("prompt_delayed") == 0) {
    return SNIaDTDModel::prompt_delayed;
  } else if (name.compare("single_degenerate") == 0) {
    return SNIaDTDModel::single_degenerate;
  }
  throw InvalidParameterError("SNIa DTD model '" + name + "' not recognized; valid "
      "models are exponential, power_law, prompt_delayed, single_degenerate");
}

std::string DTDModelName(SNIaDTDModel model) {
  switch (model) {
    case SNIaDTDModel::exponential: return "exponential";
    case SNIaDTDModel::power_law: return "power_law";
    case SNIaDTDModel::prompt_delayed: return "prompt_delayed";
    case SNIaDTDModel::single_degenerate: return "single_degenerate";
  }
  return "unknown";
}

//----------------------------------------------------------------------------------------
// keyword schema of each model

const std::vector<std::string> &ValidKeywords(SNIaDTDModel model) {
  static const std::vector<std::string> exp_keys =
      {"min_snia_time", "timescale", "snia_fraction"};
  static const std::vector<std::string> plaw_keys =
      {"min_snia_time", "nia_per_mstar", "slope"};
  static const std::vector<std::string> pdel_keys = {"A", "B", "min_snia_time"};
  static const std::vector<std::string> sdeg_keys =
      {"A", "gam", "eps", "normalize", "nia_per_mstar"};
  switch (model) {
    case SNIaDTDModel::exponential: return exp_keys;
    case SNIaDTDModel::power_law: return plaw_keys;
    case SNIaDTDModel::prompt_delayed: return pdel_keys;
    case SNIaDTDModel::single_degenerate: return sdeg_keys;
  }
  return exp_keys;
}

std::string ValidKeywordsMessage() {
  const SNIaDTDModel models[] = {SNIaDTDModel::exponential, SNIaDTDModel::power_law,
      SNIaDTDModel::prompt_delayed, SNIaDTDModel::single_degenerate};
  std::stringstream msg;
  msg << "Valid keywords:" << std::endl;
  for (auto m : models) {
    msg << DTDModelName(m) << ":";
    const std::vector<std::string> &keys = ValidKeywords(m);
    for (std::size_t i = 0; i < keys.size(); ++i) {
      msg << ((i == 0) ? " " : ", ") << keys[i];
    }
    msg << std::endl;
  }
  return msg.str();
}

//----------------------------------------------------------------------------------------
// DTDKernel

DTDKernel::DTDKernel(SNIaDTDModel model, const TimeGrid &grid) :
  model_(model), grid_(grid), ria_("ria", 0) {
}

int DTDKernel::MinDelaySteps() const {
  switch (model_) {
    case SNIaDTDModel::exponential:
      return static_cast<int>(std::ceil(exp_.min_snia_time/grid_.dt));
    case SNIaDTDModel::prompt_delayed:
      return static_cast<int>(std::ceil(pdel_.min_snia_time/grid_.dt));
    case SNIaDTDModel::power_law:
    case SNIaDTDModel::single_degenerate:
      break;
  }
  return 0;
}

void DTDKernel::SyncRia() {
  ria_.template modify<HostMemSpace>();
  ria_.template sync<DevExeSpace>();
}

//----------------------------------------------------------------------------------------
//! \fn void DTDKernel::BuildPowerLaw()
//! \brief ria[i] = t[i]^slope for t[i] >= min_snia_time, normalized so that the number
//! of SNIa per Msun formed within the first 10 Gyr is nia_per_mstar

void DTDKernel::BuildPowerLaw() {
  const int nsteps = grid_.nsteps;
  ria_ = DualArray1D<Real>("ria", nsteps);
  auto ria = ria_.h_view;
  Real dt = grid_.dt;
  Real tmin = plaw_.min_snia_time;
  Real slope = plaw_.slope;

  par_for("dtd_power_law", HostExeSpace(), 0, nsteps-1, [=](const int i) {
    Real t = i*dt;
    ria(i) = (t >= tmin) ? std::pow(t, slope) : 0.0;
  });

  Real denom = 0.0;
  for (int i = 0; i < nsteps && grid_.Time(i) <= 1.0e4; ++i) {
    denom += ria(i);
  }
  if (!(denom > 0.0) || !std::isfinite(denom)) {
    std::stringstream msg;
    msg << "power_law DTD cannot be normalized: sum of t^" << slope << " over "
        << tmin << " <= t <= 10000 Myr is " << denom;
    throw NormalizationError(msg.str());
  }

  Real norm = plaw_.nia_per_mstar/denom;
  par_for("dtd_power_law_norm", HostExeSpace(), 0, nsteps-1, [=](const int i) {
    ria(i) *= norm;
  });
  SyncRia();
}

//----------------------------------------------------------------------------------------
//! \fn DTDKernel BuildDTD()
//! \brief validates keywords against the model schema, then constructs the kernel

DTDKernel BuildDTD(SNIaDTDModel model, const DTDParameters &params, const TimeGrid &grid,
                   const StellarPhysics &physics) {
  if (!(grid.dt > 0.0) || grid.nsteps < 2) {
    std::stringstream msg;
    msg << "SNIa DTD requires dt > 0 and at least 2 time steps (dt = " << grid.dt
        << ", nsteps = " << grid.nsteps << ")";
    throw InvalidParameterError(msg.str());
  }
  ValidateKeywords(model, params);

  DTDKernel kernel(model, grid);
  switch (model) {
    case SNIaDTDModel::exponential:
      kernel.exp_.min_snia_time = ParseReal(params, "min_snia_time", 150.0);
      kernel.exp_.timescale = ParseReal(params, "timescale", 1500.0);
      kernel.exp_.snia_fraction = ParseReal(params, "snia_fraction", 0.078);
      RequireNonNegative(model, "min_snia_time", kernel.exp_.min_snia_time);
      RequireNonNegative(model, "snia_fraction", kernel.exp_.snia_fraction);
      // the reservoir loses at most all of its mass in one step
      if (!(kernel.exp_.timescale >= grid.dt)) {
        std::stringstream msg;
        msg << "exponential DTD requires timescale >= dt (timescale = "
            << kernel.exp_.timescale << ", dt = " << grid.dt << ")";
        throw InvalidParameterError(msg.str());
      }
      kernel.exp_.dmwd = grid.dt/kernel.exp_.timescale;
      break;
    case SNIaDTDModel::power_law:
      kernel.plaw_.min_snia_time = ParseReal(params, "min_snia_time", 40.0);
      kernel.plaw_.nia_per_mstar = ParseReal(params, "nia_per_mstar", 2.2e-3);
      kernel.plaw_.slope = ParseReal(params, "slope", -1.0);
      RequireNonNegative(model, "min_snia_time", kernel.plaw_.min_snia_time);
      RequireNonNegative(model, "nia_per_mstar", kernel.plaw_.nia_per_mstar);
      kernel.BuildPowerLaw();
      break;
    case SNIaDTDModel::prompt_delayed:
      kernel.pdel_.a = ParseReal(params, "A", 4.4e-8);
      kernel.pdel_.b = ParseReal(params, "B", 2.6e3);
      kernel.pdel_.min_snia_time = ParseReal(params, "min_snia_time", 40.0);
      RequireNonNegative(model, "A", kernel.pdel_.a);
      RequireNonNegative(model, "B", kernel.pdel_.b);
      RequireNonNegative(model, "min_snia_time", kernel.pdel_.min_snia_time);
      break;
    case SNIaDTDModel::single_degenerate:
      kernel.sdeg_.a = ParseReal(params, "A", 5.0e-4);
      kernel.sdeg_.gam = ParseReal(params, "gam", 2.0);
      kernel.sdeg_.eps = ParseReal(params, "eps", 1.0);
      kernel.sdeg_.normalize = ParseBool(params, "normalize", false);
      kernel.sdeg_.nia_per_mstar = ParseReal(params, "nia_per_mstar", 1.54e-3);
      RequireNonNegative(model, "A", kernel.sdeg_.a);
      RequireNonNegative(model, "nia_per_mstar", kernel.sdeg_.nia_per_mstar);
      kernel.BuildSingleDegenerate(physics);
      break;
  }

  if (global_variable::my_rank == 0) {
    std::cout << "Initialising SNIa DTD: func = " << DTDModelName(model)
              << " dt = " << grid.dt << " nsteps = " << grid.nsteps;
    if (kernel.nria() > 0) std::cout << " nria = " << kernel.nria();
    std::cout << std::endl;
  }
  return kernel;
}

DTDKernel BuildDTD(const std::string &model_name, const DTDParameters &params,
                   const TimeGrid &grid, const StellarPhysics &physics) {
  return BuildDTD(ParseDTDModel(model_name), params, grid, physics);
}

DTDKernel BuildDTD(ParameterInput *pin, const TimeGrid &grid,
                   const StellarPhysics &physics) {
  std::string func = pin->GetOrAddString("snia_dtd", "func", "exponential");
  DTDParameters params;
  for (const auto &name : pin->ParameterNames("snia_dtd")) {
    if (name.compare("func") == 0) continue;
    params[name] = pin->GetString("snia_dtd", name);
  }
  return BuildDTD(ParseDTDModel(func), params, grid, physics);
}

} // namespace snia

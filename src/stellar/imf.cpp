//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file imf.cpp
//  \brief implementation of the piecewise power-law IMF and its number/mass integrals

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "chemevo.hpp"
#include "imf.hpp"

namespace stellar {
//----------------------------------------------------------------------------------------
// constructor, checks segment layout and sets normalization of each segment so that the
// IMF is continuous at every break

IMF::IMF(const std::vector<Real> &alpha, const std::vector<Real> &mass_breaks,
         Real m_low, Real m_up) :
  alpha_(alpha), mass_breaks_(mass_breaks), m_low_(m_low), m_up_(m_up) {
  std::stringstream msg;
  if (alpha_.empty()) {
    msg << "IMF requires at least one power-law segment";
    throw std::invalid_argument(msg.str());
  }
  if (mass_breaks_.size() != alpha_.size() - 1) {
    msg << "IMF with " << alpha_.size() << " segments requires " << alpha_.size() - 1
        << " mass breaks, got " << mass_breaks_.size();
    throw std::invalid_argument(msg.str());
  }
  if (m_low_ <= 0.0 || m_up_ <= m_low_) {
    msg << "IMF mass range [" << m_low_ << ", " << m_up_ << "] is invalid";
    throw std::invalid_argument(msg.str());
  }
  Real prev = m_low_;
  for (Real b : mass_breaks_) {
    if (b <= prev || b >= m_up_) {
      msg << "IMF mass breaks must increase strictly inside (" << m_low_ << ", "
          << m_up_ << ")";
      throw std::invalid_argument(msg.str());
    }
    prev = b;
  }

  norm_.resize(alpha_.size());
  norm_[0] = 1.0;
  for (std::size_t i = 1; i < alpha_.size(); ++i) {
    norm_[i] = norm_[i-1]*std::pow(mass_breaks_[i-1], alpha_[i] - alpha_[i-1]);
  }
}

//----------------------------------------------------------------------------------------
//! \fn IMF IMF::Kroupa()
//  \brief Kroupa (2001) two-segment IMF

IMF IMF::Kroupa(Real m_low, Real m_up) {
  return IMF({1.3, 2.3}, {0.5}, m_low, m_up);
}

//----------------------------------------------------------------------------------------
//! \fn IMF IMF::Salpeter()
//  \brief Salpeter (1955) single power law

IMF IMF::Salpeter(Real m_low, Real m_up) {
  return IMF({2.35}, {}, m_low, m_up);
}

//----------------------------------------------------------------------------------------
//! \fn Real IMF::IntegrateSegment()
//  \brief integral of c_i m^(power - alpha_i) over the part of [m1,m2] inside segment i.
//  power = 0 gives the number of stars, power = 1 their mass.

Real IMF::IntegrateSegment(int i, Real m1, Real m2, Real power) const {
  Real a = std::max(m1, SegmentLow(i));
  Real b = std::min(m2, SegmentHigh(i));
  if (b <= a) return 0.0;

  Real expo = power - alpha_[i] + 1.0;
  if (std::fabs(expo) < 1.0e-12) {
    return norm_[i]*std::log(b/a);
  }
  return norm_[i]*(std::pow(b, expo) - std::pow(a, expo))/expo;
}

Real IMF::NumberIntegral(Real m1, Real m2) const {
  Real sum = 0.0;
  for (int i = 0; i < nsegments(); ++i) {
    sum += IntegrateSegment(i, m1, m2, 0.0);
  }
  return sum;
}

Real IMF::MassIntegral(Real m1, Real m2) const {
  Real sum = 0.0;
  for (int i = 0; i < nsegments(); ++i) {
    sum += IntegrateSegment(i, m1, m2, 1.0);
  }
  return sum;
}

//----------------------------------------------------------------------------------------
//! \fn IMF MakeIMF()
//  \brief select IMF by name

IMF MakeIMF(const std::string &name, Real m_low, Real m_up) {
  if (name.compare("kroupa") == 0) {
    return IMF::Kroupa(m_low, m_up);
  } else if (name.compare("salpeter") == 0) {
    return IMF::Salpeter(m_low, m_up);
  }
  throw std::invalid_argument("IMF '" + name + "' not recognized; valid choices are "
                              "kroupa, salpeter");
}

} // namespace stellar

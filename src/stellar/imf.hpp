#ifndef STELLAR_IMF_HPP_
#define STELLAR_IMF_HPP_
//========================================================================================
// AthenaXXX astrophysical plasma code
// Copyright(C) 2020 James M. Stone <jmstone@ias.edu> and the Athena code team
// Licensed under the 3-clause BSD License (the "LICENSE")
//========================================================================================
//! \file imf.hpp
//  \brief definitions for the piecewise power-law initial mass function (IMF)

#include <string>
#include <vector>

#include "chemevo.hpp"

namespace stellar {

//----------------------------------------------------------------------------------------
//! \class IMF
//  \brief dN/dm = c_i m^(-alpha_i) on segment i, continuous across mass_breaks.
//  Segment i spans [mass_breaks[i-1], mass_breaks[i]); the first segment starts at
//  m_low and the last ends at m_up.  Normalization is arbitrary (c_0 = 1), so only
//  ratios of integrals are physical.

class IMF {
 public:
  IMF(const std::vector<Real> &alpha, const std::vector<Real> &mass_breaks,
      Real m_low, Real m_up);

  static IMF Kroupa(Real m_low = 0.1, Real m_up = 100.0);
  static IMF Salpeter(Real m_low = 0.1, Real m_up = 100.0);

  // integrals over [m1, m2], clamped to [m_low, m_up]
  Real NumberIntegral(Real m1, Real m2) const;
  Real MassIntegral(Real m1, Real m2) const;
  Real TotalNumber() const { return NumberIntegral(m_low_, m_up_); }
  Real TotalMass() const { return MassIntegral(m_low_, m_up_); }

  const std::vector<Real> &alpha() const { return alpha_; }
  const std::vector<Real> &mass_breaks() const { return mass_breaks_; }
  Real m_low() const { return m_low_; }
  Real m_up() const { return m_up_; }
  int nsegments() const { return static_cast<int>(alpha_.size()); }

 private:
  std::vector<Real> alpha_;        // positive slopes, dN/dm ~ m^-alpha
  std::vector<Real> mass_breaks_;  // nsegments-1 interior boundaries
  std::vector<Real> norm_;         // c_i for each segment
  Real m_low_, m_up_;

  Real SegmentLow(int i) const { return (i == 0) ? m_low_ : mass_breaks_[i-1]; }
  Real SegmentHigh(int i) const {
    return (i == nsegments() - 1) ? m_up_ : mass_breaks_[i];
  }
  Real IntegrateSegment(int i, Real m1, Real m2, Real power) const;
};

// select IMF by name ("kroupa" or "salpeter"); throws std::invalid_argument otherwise
IMF MakeIMF(const std::string &name, Real m_low, Real m_up);

} // namespace stellar
#endif // STELLAR_IMF_HPP_

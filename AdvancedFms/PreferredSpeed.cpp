// ****************************************************************************
// NOTICE
//
// This work was produced for the U.S. Government under Contract 693KA8-22-C-00001
// and is subject to Federal Aviation Administration Acquisition Management System
// Clause 3.5-13, Rights In Data-General, Alt. III and Alt. IV (Oct. 1996).
//
// The contents of this document reflect the views of the author and The MITRE
// Corporation and do not necessarily reflect the views of the Federal Aviation
// Administration (FAA) or the Department of Transportation (DOT). Neither the FAA
// nor the DOT makes any warranty or guarantee, expressed or implied, concerning
// the content or accuracy of these views.
//
// For further information, please contact The MITRE Corporation, Contracts Management
// Office, 7515 Colshire Drive, McLean, VA 22102-7539, (703) 983-6000.
//
// 2023 The MITRE Corporation. All Rights Reserved.
// ****************************************************************************

#include "afms/PreferredSpeed.h"

#include <stdexcept>
#include <string>
#include "utility/BoundedValue.h"

using namespace afms::open_source;

PreferredSpeed::PreferredSpeed() : m_speed_type(CAS), m_value(0) {}

PreferredSpeed::PreferredSpeed(const SpeedType speed_type, const double value)
   : m_speed_type(speed_type), m_value(value) {}

PreferredSpeed PreferredSpeed::FromValue(const double value) {
   if (value < 1.0) {
      return Mach(value);
   }
   return Cas(Units::MetersPerSecondSpeed(value));
}

PreferredSpeed PreferredSpeed::Mach(const double mach) {
   if (mach <= 0 || mach >= 1.0) {
      throw std::invalid_argument("preferred Mach out of range: " + std::to_string(mach));
   }
   return PreferredSpeed(MACH, mach);
}

PreferredSpeed PreferredSpeed::Cas(const Units::Speed cas) {
   const double cas_mps = Units::MetersPerSecondSpeed(cas).value();
   if (cas_mps < 1.0) {
      throw std::invalid_argument("preferred CAS below 1 m/s: " + std::to_string(cas_mps));
   }
   return PreferredSpeed(CAS, cas_mps);
}

double PreferredSpeed::GetMach() const {
   if (m_speed_type != MACH) {
      throw std::logic_error("preferred speed is not a Mach number");
   }
   return m_value;
}

Units::Speed PreferredSpeed::GetCas() const {
   if (m_speed_type != CAS) {
      throw std::logic_error("preferred speed is not a calibrated airspeed");
   }
   return Units::MetersPerSecondSpeed(m_value);
}

Units::Speed PreferredSpeed::ToCas(const std::shared_ptr<Atmosphere> &atmosphere, const Units::Length altitude) const {
   if (m_speed_type == CAS) {
      return Units::MetersPerSecondSpeed(m_value);
   }
   return atmosphere->MachToIAS(BoundedValue<double, 0, 2>(m_value), altitude);
}

bool PreferredSpeed::operator==(const PreferredSpeed &obj) const {
   return m_speed_type == obj.m_speed_type && m_value == obj.m_value;
}

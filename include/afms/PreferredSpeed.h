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

#pragma once

#include <memory>
#include <scalar/Length.h>
#include <scalar/Speed.h>
#include "public/StandardAtmosphere.h"

namespace afms {
namespace open_source {
class PreferredSpeed {
  public:
   enum SpeedType { MACH = 0, CAS };

   PreferredSpeed();

   ~PreferredSpeed() = default;

   // Raw annotation value: below 1 is a Mach number, otherwise CAS in m/s.
   static PreferredSpeed FromValue(const double value);

   static PreferredSpeed Mach(const double mach);

   static PreferredSpeed Cas(const Units::Speed cas);

   SpeedType GetSpeedType() const;

   double GetMach() const;

   Units::Speed GetCas() const;

   double GetRawValue() const;

   Units::Speed ToCas(const std::shared_ptr<Atmosphere> &atmosphere, const Units::Length altitude) const;

   bool operator==(const PreferredSpeed &obj) const;

   bool operator!=(const PreferredSpeed &obj) const;

  private:
   PreferredSpeed(const SpeedType speed_type, const double value);

   SpeedType m_speed_type;
   double m_value;
};

inline PreferredSpeed::SpeedType PreferredSpeed::GetSpeedType() const { return m_speed_type; }

inline double PreferredSpeed::GetRawValue() const { return m_value; }

inline bool PreferredSpeed::operator!=(const PreferredSpeed &obj) const { return !operator==(obj); }
}  // namespace open_source
}  // namespace afms

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

#include <scalar/Time.h>
#include "loader/DecodedStream.h"
#include "loader/Loadable.h"
#include "public/Logging.h"

namespace afms {
namespace open_source {
class AfmsConfiguration : public Loadable {
  public:
   AfmsConfiguration();
   virtual ~AfmsConfiguration();

   bool load(DecodedStream *input);

   void DumpParameters() const;

   static const AfmsConfiguration &GetDefaultConfiguration();

  private:
   static log4cplus::Logger m_logger;

   void Validate() const;

  public:
   static const Units::SecondsTime UPDATE_INTERVAL_DEFAULT;
   static const Units::SecondsTime STANDARD_WINDOW_SIZE_DEFAULT;
   static const Units::SecondsTime SKIP_THRESHOLD_DEFAULT;
   static const double ACCELERATION_DEFAULT;
   static const double DECELERATION_DEFAULT;
   static const int SOLVER_ITERATIONS_DEFAULT;

   Units::SecondsTime m_update_interval;
   Units::SecondsTime m_standard_window_size;
   Units::SecondsTime m_skip_threshold;

   // meters per second squared, deceleration is negative
   double m_acceleration;
   double m_deceleration;

   int m_solver_iterations;

   bool m_loaded;
};

} /* namespace open_source */
} /* namespace afms */

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

#include "afms/AfmsConfiguration.h"

#include "loader/LoadError.h"

using namespace afms::open_source;

log4cplus::Logger AfmsConfiguration::m_logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("AfmsConfiguration"));

const Units::SecondsTime AfmsConfiguration::UPDATE_INTERVAL_DEFAULT(60);
const Units::SecondsTime AfmsConfiguration::STANDARD_WINDOW_SIZE_DEFAULT(60);
const Units::SecondsTime AfmsConfiguration::SKIP_THRESHOLD_DEFAULT(120);
const double AfmsConfiguration::ACCELERATION_DEFAULT(0.97);
const double AfmsConfiguration::DECELERATION_DEFAULT(-0.6325);
const int AfmsConfiguration::SOLVER_ITERATIONS_DEFAULT(3);

AfmsConfiguration::AfmsConfiguration()
   : m_update_interval(UPDATE_INTERVAL_DEFAULT),
     m_standard_window_size(STANDARD_WINDOW_SIZE_DEFAULT),
     m_skip_threshold(SKIP_THRESHOLD_DEFAULT),
     m_acceleration(ACCELERATION_DEFAULT),
     m_deceleration(DECELERATION_DEFAULT),
     m_solver_iterations(SOLVER_ITERATIONS_DEFAULT),
     m_loaded(false) {}

AfmsConfiguration::~AfmsConfiguration() {}

const AfmsConfiguration &AfmsConfiguration::GetDefaultConfiguration() {
   static const AfmsConfiguration default_configuration;
   return default_configuration;
}

bool AfmsConfiguration::load(DecodedStream *input) {
   set_stream(input);

   // all values have defaults if not loaded
   register_var("update_interval", &m_update_interval);
   register_var("standard_window_size", &m_standard_window_size);
   register_var("skip_threshold", &m_skip_threshold);
   register_var("acceleration", &m_acceleration);
   register_var("deceleration", &m_deceleration);
   register_var("solver_iterations", &m_solver_iterations);

   m_loaded = complete();

   Validate();

   return m_loaded;
}

void AfmsConfiguration::Validate() const {
   if (m_update_interval <= Units::zero()) {
      std::string msg = "update_interval must be positive-check scenario";
      LOG4CPLUS_FATAL(m_logger, msg);
      throw LoadError(msg);
   }

   if (m_standard_window_size < Units::zero()) {
      std::string msg = "standard_window_size must not be negative-check scenario";
      LOG4CPLUS_FATAL(m_logger, msg);
      throw LoadError(msg);
   }

   if (m_acceleration <= 0) {
      std::string msg = "acceleration must be positive-check scenario";
      LOG4CPLUS_FATAL(m_logger, msg);
      throw LoadError(msg);
   }

   if (m_deceleration >= 0) {
      std::string msg = "deceleration must be negative-check scenario";
      LOG4CPLUS_FATAL(m_logger, msg);
      throw LoadError(msg);
   }

   if (m_solver_iterations < 1) {
      std::string msg = "solver_iterations must be at least 1-check scenario";
      LOG4CPLUS_FATAL(m_logger, msg);
      throw LoadError(msg);
   }
}

void AfmsConfiguration::DumpParameters() const {
   LOG4CPLUS_DEBUG(m_logger, "update_interval " << m_update_interval.value() << " s");
   LOG4CPLUS_DEBUG(m_logger, "standard_window_size " << m_standard_window_size.value() << " s");
   LOG4CPLUS_DEBUG(m_logger, "skip_threshold " << m_skip_threshold.value() << " s");
   LOG4CPLUS_DEBUG(m_logger, "acceleration " << m_acceleration << " m/s^2");
   LOG4CPLUS_DEBUG(m_logger, "deceleration " << m_deceleration << " m/s^2");
   LOG4CPLUS_DEBUG(m_logger, "solver_iterations " << m_solver_iterations);
}

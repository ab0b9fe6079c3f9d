/*
 Copyright (C) 2026 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of CRE, a free-software/open-source library
 for multi-curve calibration and market quote risk analysis

 CRE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file cred/utilities/to_string.hpp
    \brief string conversion utilities
    \ingroup utilities
*/

#pragma once

#include <ql/time/businessdayconvention.hpp>
#include <ql/time/calendar.hpp>
#include <ql/time/date.hpp>
#include <ql/time/daycounter.hpp>
#include <ql/time/frequency.hpp>
#include <ql/time/period.hpp>

#include <sstream>
#include <string>

namespace cre {
namespace data {

//! Convert QuantLib::Date to std::string
/*!
  Returns date as a string in YYYY-MM-DD format, which matches QuantLib::io::iso_date()
  However that function can have issues with locale so we have a local snprintf() based version.

  If date == Date() returns 1900-01-01 so the above format is preserved.
  \ingroup utilities
 */
std::string to_string(const QuantLib::Date& date);

//! Convert bool to std::string
/*!
  Returns "true" for true and "false" for false
  \ingroup utilities
 */
std::string to_string(bool aBool);

//! Convert QuantLib::Period to std::string, e.g. 3M or 1Y
/*! \ingroup utilities */
std::string to_string(const QuantLib::Period& period);

//! Convert QuantLib::DayCounter to the short code understood by parseDayCounter, e.g. A360
/*! \ingroup utilities */
std::string to_string(const QuantLib::DayCounter& dc);

//! Convert QuantLib::BusinessDayConvention to the short code understood by parseBusinessDayConvention, e.g. MF
/*! \ingroup utilities */
std::string to_string(const QuantLib::BusinessDayConvention& bdc);

//! Convert QuantLib::Frequency to the short code understood by parseFrequency, e.g. Q
/*! \ingroup utilities */
std::string to_string(const QuantLib::Frequency& f);

//! Convert type to std::string
/*!
  Utility to give a to_string() interface to classes and enums that have ostream<< operators defined.
  \ingroup utilities
*/
template <class T> std::string to_string(const T& t) {
    std::ostringstream oss;
    oss << t;
    return oss.str();
}

} // namespace data
} // namespace cre

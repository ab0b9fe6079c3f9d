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

/*! \file cred/utilities/parsers.hpp
    \brief Map text representations to QuantLib and CRE objects and enumerations
    \ingroup utilities
*/

#pragma once

#include <cve/instruments/calibrationinstrument.hpp>
#include <cve/termstructures/interpolatedparametercurve.hpp>

#include <ql/time/businessdayconvention.hpp>
#include <ql/time/calendar.hpp>
#include <ql/time/date.hpp>
#include <ql/time/daycounter.hpp>
#include <ql/time/frequency.hpp>
#include <ql/time/period.hpp>
#include <ql/types.hpp>

#include <string>
#include <vector>

namespace cre {
namespace data {

//! Convert std::string to QuantLib::Date
/*! The formats YYYY-MM-DD, YYYYMMDD and DD/MM/YYYY are accepted
    \ingroup utilities
*/
QuantLib::Date parseDate(const std::string& s);

//! Convert text to Real
/*! \ingroup utilities */
QuantLib::Real parseReal(const std::string& s);

//! Attempt to convert text to Real
/*! Attempts to convert text to Real
    \param[in]  s      The string we wish to convert to a Real
    \param[out] result The result of the conversion if it is valid.
                       Null<Real>() if conversion fails

    \return True if the conversion was successful, False if not

    \ingroup utilities
*/
bool tryParseReal(const std::string& s, QuantLib::Real& result);

//! Convert text to QuantLib::Integer
/*! \ingroup utilities */
QuantLib::Integer parseInteger(const std::string& s);

//! Convert text to bool
/*! \ingroup utilities */
bool parseBool(const std::string& s);

//! Convert text to QuantLib::Calendar
/*! A small set of calendars is supported, given by name or currency, e.g. TARGET or EUR.
    \ingroup utilities
*/
QuantLib::Calendar parseCalendar(const std::string& s);

//! Convert text to QuantLib::Period
/*! \ingroup utilities */
QuantLib::Period parsePeriod(const std::string& s);

//! Convert text to QuantLib::BusinessDayConvention
/*! \ingroup utilities */
QuantLib::BusinessDayConvention parseBusinessDayConvention(const std::string& s);

//! Convert text to QuantLib::DayCounter
/*! \ingroup utilities */
QuantLib::DayCounter parseDayCounter(const std::string& s);

//! Convert text to QuantLib::Frequency
/*! \ingroup utilities */
QuantLib::Frequency parseFrequency(const std::string& s);

//! Convert text to QuantLib::Month, e.g. Mar or March or 3
/*! \ingroup utilities */
QuantLib::Month parseMonth(const std::string& s);

//! Convert text to CurveExt::CurveValueType
/*! \ingroup utilities */
CurveExt::CurveValueType parseCurveValueType(const std::string& s);

//! Convert text to CurveExt::Interpolator
/*! \ingroup utilities */
CurveExt::Interpolator parseInterpolator(const std::string& s);

//! Convert text to CurveExt::Extrapolator
/*! \ingroup utilities */
CurveExt::Extrapolator parseExtrapolator(const std::string& s);

//! Convert text to CurveExt::CalibrationMeasure
/*! \ingroup utilities */
CurveExt::CalibrationMeasure parseCalibrationMeasure(const std::string& s);

//! Convert comma separated list to vector of strings, the tokens are trimmed
/*! \ingroup utilities */
std::vector<std::string> parseListOfValues(const std::string& s);

} // namespace data
} // namespace cre

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

/*! \file cred/utilities/parsers.cpp
    \brief Map text representations to QuantLib and CRE objects and enumerations
    \ingroup utilities
*/

#include <cred/utilities/parsers.hpp>

#include <ql/errors.hpp>
#include <ql/time/calendars/all.hpp>
#include <ql/time/daycounters/all.hpp>
#include <ql/utilities/dataparsers.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <map>

using namespace QuantLib;
using namespace std;
using boost::algorithm::to_upper_copy;

namespace cre {
namespace data {

Date parseDate(const string& s) {
    // guard against the empty string
    QL_REQUIRE(!s.empty(), "Cannot convert empty string to date");

    if (s.size() == 10 && s[4] == '-' && s[7] == '-') {
        // YYYY-MM-DD
        return DateParser::parseISO(s);
    }
    if (s.size() == 8 && s.find_first_not_of("0123456789") == string::npos) {
        // YYYYMMDD
        Year y = boost::lexical_cast<Year>(s.substr(0, 4));
        Month m = static_cast<Month>(boost::lexical_cast<Integer>(s.substr(4, 2)));
        Day d = boost::lexical_cast<Day>(s.substr(6, 2));
        return Date(d, m, y);
    }
    if (s.size() == 10 && s[2] == '/' && s[5] == '/') {
        // DD/MM/YYYY
        return DateParser::parseFormatted(s, "%d/%m/%Y");
    }
    QL_FAIL("Cannot convert \"" << s << "\" to Date.");
}

Real parseReal(const string& s) {
    try {
        return boost::lexical_cast<Real>(boost::trim_copy(s));
    } catch (const boost::bad_lexical_cast&) {
        QL_FAIL("Failed to parseReal(\"" << s << "\")");
    }
}

bool tryParseReal(const string& s, QuantLib::Real& result) {
    try {
        result = boost::lexical_cast<Real>(boost::trim_copy(s));
    } catch (const boost::bad_lexical_cast&) {
        result = Null<Real>();
        return false;
    }
    return true;
}

Integer parseInteger(const string& s) {
    try {
        return boost::lexical_cast<Integer>(boost::trim_copy(s));
    } catch (const boost::bad_lexical_cast&) {
        QL_FAIL("Failed to parseInteger(\"" << s << "\")");
    }
}

bool parseBool(const string& s) {
    static map<string, bool> b = {{"Y", true},       {"YES", true},  {"TRUE", true},   {"true", true},
                                  {"1", true},       {"N", false},   {"NO", false},    {"FALSE", false},
                                  {"false", false},  {"0", false}};

    auto it = b.find(s);
    if (it != b.end()) {
        return it->second;
    } else {
        QL_FAIL("Cannot convert \"" << s << "\" to bool");
    }
}

Calendar parseCalendar(const string& s) {
    static map<string, Calendar> m = {{"TARGET", TARGET()},
                                      {"TGT", TARGET()},
                                      {"EUR", TARGET()},
                                      {"UK", UnitedKingdom()},
                                      {"GB", UnitedKingdom()},
                                      {"GBP", UnitedKingdom()},
                                      {"London", UnitedKingdom()},
                                      {"US", UnitedStates(UnitedStates::Settlement)},
                                      {"USD", UnitedStates(UnitedStates::Settlement)},
                                      {"US-SET", UnitedStates(UnitedStates::Settlement)},
                                      {"US-SOFR", UnitedStates(UnitedStates::SOFR)},
                                      {"US-GOV", UnitedStates(UnitedStates::GovernmentBond)},
                                      {"JP", Japan()},
                                      {"JPY", Japan()},
                                      {"CH", Switzerland()},
                                      {"CHF", Switzerland()},
                                      {"WeekendsOnly", WeekendsOnly()},
                                      {"NullCalendar", NullCalendar()},
                                      {"", NullCalendar()}};

    auto it = m.find(s);
    if (it != m.end())
        return it->second;

    // joint calendar given by a comma separated list
    vector<string> tokens = parseListOfValues(s);
    QL_REQUIRE(tokens.size() > 1, "Cannot convert \"" << s << "\" to Calendar");
    vector<Calendar> calendars;
    for (auto const& t : tokens)
        calendars.push_back(parseCalendar(t));
    return JointCalendar(calendars);
}

Period parsePeriod(const string& s) {
    QL_REQUIRE(!s.empty(), "Cannot convert empty string to Period");
    return PeriodParser::parse(s);
}

BusinessDayConvention parseBusinessDayConvention(const string& s) {
    static map<string, BusinessDayConvention> m = {{"F", Following},
                                                   {"Following", Following},
                                                   {"FOLLOWING", Following},
                                                   {"MF", ModifiedFollowing},
                                                   {"ModifiedFollowing", ModifiedFollowing},
                                                   {"Modified Following", ModifiedFollowing},
                                                   {"MODIFIEDF", ModifiedFollowing},
                                                   {"P", Preceding},
                                                   {"Preceding", Preceding},
                                                   {"MP", ModifiedPreceding},
                                                   {"ModifiedPreceding", ModifiedPreceding},
                                                   {"U", Unadjusted},
                                                   {"Unadjusted", Unadjusted},
                                                   {"INDIFF", Unadjusted},
                                                   {"HMMF", HalfMonthModifiedFollowing},
                                                   {"HalfMonthModifiedFollowing", HalfMonthModifiedFollowing},
                                                   {"NEAREST", Nearest},
                                                   {"Nearest", Nearest}};

    auto it = m.find(s);
    if (it != m.end()) {
        return it->second;
    } else {
        QL_FAIL("Cannot convert \"" << s << "\" to BusinessDayConvention");
    }
}

DayCounter parseDayCounter(const string& s) {
    static map<string, DayCounter> m = {{"A360", Actual360()},
                                        {"Actual/360", Actual360()},
                                        {"ACT/360", Actual360()},
                                        {"Act/360", Actual360()},
                                        {"A365", Actual365Fixed()},
                                        {"A365F", Actual365Fixed()},
                                        {"Actual/365 (Fixed)", Actual365Fixed()},
                                        {"ACT/365", Actual365Fixed()},
                                        {"Act/365", Actual365Fixed()},
                                        {"ACT/365.FIXED", Actual365Fixed()},
                                        {"T360", Thirty360(Thirty360::USA)},
                                        {"30/360", Thirty360(Thirty360::USA)},
                                        {"30/360 (US)", Thirty360(Thirty360::USA)},
                                        {"30/360 (Bond Basis)", Thirty360(Thirty360::BondBasis)},
                                        {"30E/360", Thirty360(Thirty360::European)},
                                        {"30E/360 (Eurobond Basis)", Thirty360(Thirty360::European)},
                                        {"ACT/ACT", ActualActual(ActualActual::ISDA)},
                                        {"ActActISDA", ActualActual(ActualActual::ISDA)},
                                        {"ACT/ACT.ISDA", ActualActual(ActualActual::ISDA)},
                                        {"Actual/Actual (ISDA)", ActualActual(ActualActual::ISDA)},
                                        {"1/1", OneDayCounter()}};

    auto it = m.find(s);
    if (it != m.end()) {
        return it->second;
    } else {
        QL_FAIL("DayCounter \"" << s << "\" not recognized");
    }
}

Frequency parseFrequency(const string& s) {
    static map<string, Frequency> m = {{"Z", Once},
                                       {"Once", Once},
                                       {"A", Annual},
                                       {"Annual", Annual},
                                       {"S", Semiannual},
                                       {"Semiannual", Semiannual},
                                       {"Q", Quarterly},
                                       {"Quarterly", Quarterly},
                                       {"B", Bimonthly},
                                       {"Bimonthly", Bimonthly},
                                       {"M", Monthly},
                                       {"Monthly", Monthly},
                                       {"L", EveryFourthWeek},
                                       {"Lunarmonth", EveryFourthWeek},
                                       {"W", Weekly},
                                       {"Weekly", Weekly},
                                       {"D", Daily},
                                       {"Daily", Daily}};

    auto it = m.find(s);
    if (it != m.end()) {
        return it->second;
    } else {
        QL_FAIL("Frequency \"" << s << "\" not recognized");
    }
}

Month parseMonth(const string& s) {
    static map<string, Month> m = {{"JAN", Jan}, {"FEB", Feb}, {"MAR", Mar}, {"APR", Apr},
                                   {"MAY", May}, {"JUN", Jun}, {"JUL", Jul}, {"AUG", Aug},
                                   {"SEP", Sep}, {"OCT", Oct}, {"NOV", Nov}, {"DEC", Dec}};

    string upper = to_upper_copy(s);
    auto it = m.find(upper.substr(0, 3));
    if (upper.size() >= 3 && it != m.end())
        return it->second;

    Integer i;
    try {
        i = boost::lexical_cast<Integer>(s);
    } catch (const boost::bad_lexical_cast&) {
        QL_FAIL("Cannot convert \"" << s << "\" to Month");
    }
    QL_REQUIRE(i >= 1 && i <= 12, "Cannot convert \"" << s << "\" to Month, expected 1 to 12");
    return static_cast<Month>(i);
}

CurveExt::CurveValueType parseCurveValueType(const string& s) {
    static map<string, CurveExt::CurveValueType> m = {
        {"ZeroRate", CurveExt::CurveValueType::ZeroRate},
        {"Zero", CurveExt::CurveValueType::ZeroRate},
        {"DiscountFactor", CurveExt::CurveValueType::DiscountFactor},
        {"Discount", CurveExt::CurveValueType::DiscountFactor},
        {"LogDiscountFactor", CurveExt::CurveValueType::LogDiscountFactor}};

    auto it = m.find(s);
    if (it != m.end()) {
        return it->second;
    } else {
        QL_FAIL("Curve value type \"" << s << "\" not recognized");
    }
}

CurveExt::Interpolator parseInterpolator(const string& s) {
    static map<string, CurveExt::Interpolator> m = {{"Linear", CurveExt::Interpolator::Linear},
                                                    {"LogLinear", CurveExt::Interpolator::LogLinear},
                                                    {"NaturalCubic", CurveExt::Interpolator::NaturalCubic},
                                                    {"LogNaturalCubic", CurveExt::Interpolator::LogNaturalCubic}};

    auto it = m.find(s);
    if (it != m.end()) {
        return it->second;
    } else {
        QL_FAIL("Interpolator \"" << s << "\" not recognized");
    }
}

CurveExt::Extrapolator parseExtrapolator(const string& s) {
    static map<string, CurveExt::Extrapolator> m = {{"Flat", CurveExt::Extrapolator::Flat},
                                                    {"Linear", CurveExt::Extrapolator::Linear}};

    auto it = m.find(s);
    if (it != m.end()) {
        return it->second;
    } else {
        QL_FAIL("Extrapolator \"" << s << "\" not recognized");
    }
}

CurveExt::CalibrationMeasure parseCalibrationMeasure(const string& s) {
    static map<string, CurveExt::CalibrationMeasure> m = {
        {"ParSpread", CurveExt::CalibrationMeasure::ParSpread},
        {"PresentValue", CurveExt::CalibrationMeasure::PresentValue},
        {"PV", CurveExt::CalibrationMeasure::PresentValue}};

    auto it = m.find(s);
    if (it != m.end()) {
        return it->second;
    } else {
        QL_FAIL("Calibration measure \"" << s << "\" not recognized");
    }
}

vector<string> parseListOfValues(const string& s) {
    vector<string> result;
    string t = boost::trim_copy(s);
    if (t.empty())
        return result;
    boost::split(result, t, boost::is_any_of(","));
    for (auto& r : result)
        boost::trim(r);
    return result;
}

} // namespace data
} // namespace cre

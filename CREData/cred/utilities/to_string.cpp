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

/*! \file cred/utilities/to_string.cpp
    \brief string conversion utilities
    \ingroup utilities
*/

#include <cred/utilities/to_string.hpp>

#include <ql/errors.hpp>

#include <cstdio>
#include <map>

using namespace QuantLib;

namespace cre {
namespace data {

std::string to_string(const Date& date) {
    if (date == Date())
        return "1900-01-01";
    char buf[11];
    int y = date.year();
    int m = static_cast<int>(date.month());
    int d = date.dayOfMonth();
    int n = snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
    QL_REQUIRE(n == 10, "Failed to convert date " << date << " to_string() n:" << n);
    return std::string(buf);
}

std::string to_string(bool aBool) { return aBool ? "true" : "false"; }

std::string to_string(const Period& period) {
    std::ostringstream oss;
    oss << period.length();
    switch (period.units()) {
    case Days:
        oss << "D";
        break;
    case Weeks:
        oss << "W";
        break;
    case Months:
        oss << "M";
        break;
    case Years:
        oss << "Y";
        break;
    default:
        QL_FAIL("unsupported time unit " << period.units() << " in period " << period);
    }
    return oss.str();
}

std::string to_string(const DayCounter& dc) {
    static std::map<std::string, std::string> m = {{"Actual/360", "A360"},
                                                   {"Actual/365 (Fixed)", "A365F"},
                                                   {"Actual/Actual (ISDA)", "ACT/ACT"},
                                                   {"1/1", "1/1"}};
    auto it = m.find(dc.name());
    return it == m.end() ? dc.name() : it->second;
}

std::string to_string(const BusinessDayConvention& bdc) {
    switch (bdc) {
    case Following:
        return "F";
    case ModifiedFollowing:
        return "MF";
    case Preceding:
        return "P";
    case ModifiedPreceding:
        return "MP";
    case Unadjusted:
        return "U";
    case HalfMonthModifiedFollowing:
        return "HMMF";
    case Nearest:
        return "NEAREST";
    default:
        QL_FAIL("unsupported business day convention " << bdc);
    }
}

std::string to_string(const Frequency& f) {
    switch (f) {
    case Once:
        return "Z";
    case Annual:
        return "A";
    case Semiannual:
        return "S";
    case Quarterly:
        return "Q";
    case Bimonthly:
        return "B";
    case Monthly:
        return "M";
    case EveryFourthWeek:
        return "L";
    case Weekly:
        return "W";
    case Daily:
        return "D";
    default:
        QL_FAIL("unsupported frequency " << f);
    }
}

} // namespace data
} // namespace cre

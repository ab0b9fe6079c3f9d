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

/*! \file cve/sensitivities/pointsensitivities.hpp
    \brief Sensitivities of a value to the discount factors of a curve at single dates
    \ingroup sensitivities
*/

#ifndef curveext_pointsensitivities_hpp
#define curveext_pointsensitivities_hpp

#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace CurveExt {

//! Derivative of a value w.r.t. the discount factor of a curve at a date
struct PointSensitivity {
    PointSensitivity() : time(0.0), sensitivity(0.0) {}
    PointSensitivity(const std::string& curveName, const QuantLib::Date& date, QuantLib::Time time,
                     QuantLib::Real sensitivity, const std::string& currency)
        : curveName(curveName), date(date), time(time), sensitivity(sensitivity), currency(currency) {}

    std::string curveName;
    QuantLib::Date date;
    //! curve time of the date
    QuantLib::Time time;
    QuantLib::Real sensitivity;
    //! currency of the value
    std::string currency;
};

bool operator<(const PointSensitivity& a, const PointSensitivity& b);

//! Collection of point sensitivities
/*! The entries are kept in insertion order, normalized() merges entries with the same curve,
    date and currency and sorts them.
*/
class PointSensitivities {
public:
    PointSensitivities() {}
    explicit PointSensitivities(const std::vector<PointSensitivity>& entries) : entries_(entries) {}

    void add(const PointSensitivity& s) { entries_.push_back(s); }
    void add(const std::string& curveName, const QuantLib::Date& date, QuantLib::Time time,
             QuantLib::Real sensitivity, const std::string& currency) {
        entries_.push_back(PointSensitivity(curveName, date, time, sensitivity, currency));
    }

    const std::vector<PointSensitivity>& entries() const { return entries_; }
    QuantLib::Size size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    PointSensitivities combinedWith(const PointSensitivities& other) const;
    PointSensitivities multipliedBy(QuantLib::Real factor) const;
    PointSensitivities normalized() const;

private:
    std::vector<PointSensitivity> entries_;
};

std::ostream& operator<<(std::ostream& out, const PointSensitivity& s);

} // namespace CurveExt

#endif

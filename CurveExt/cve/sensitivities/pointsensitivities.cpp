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

#include <cve/sensitivities/pointsensitivities.hpp>

#include <algorithm>
#include <tuple>

using namespace QuantLib;

namespace CurveExt {

bool operator<(const PointSensitivity& a, const PointSensitivity& b) {
    return std::tie(a.curveName, a.currency, a.date) < std::tie(b.curveName, b.currency, b.date);
}

PointSensitivities PointSensitivities::combinedWith(const PointSensitivities& other) const {
    std::vector<PointSensitivity> entries(entries_);
    entries.insert(entries.end(), other.entries_.begin(), other.entries_.end());
    return PointSensitivities(entries);
}

PointSensitivities PointSensitivities::multipliedBy(Real factor) const {
    std::vector<PointSensitivity> entries(entries_);
    for (auto& e : entries)
        e.sensitivity *= factor;
    return PointSensitivities(entries);
}

PointSensitivities PointSensitivities::normalized() const {
    std::vector<PointSensitivity> sorted(entries_);
    std::stable_sort(sorted.begin(), sorted.end());
    std::vector<PointSensitivity> merged;
    for (auto const& e : sorted) {
        if (!merged.empty() && !(merged.back() < e) && !(e < merged.back()))
            merged.back().sensitivity += e.sensitivity;
        else
            merged.push_back(e);
    }
    return PointSensitivities(merged);
}

std::ostream& operator<<(std::ostream& out, const PointSensitivity& s) {
    return out << s.curveName << " " << io::iso_date(s.date) << " (" << s.time << ") " << s.sensitivity << " "
               << s.currency;
}

} // namespace CurveExt

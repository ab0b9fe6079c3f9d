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

#include <crea/engine/calibrationoutcome.hpp>

#include <ql/errors.hpp>

namespace cre {
namespace analytics {

std::ostream& operator<<(std::ostream& out, const CalibrationFailure& f) {
    out << f.kind << " in curve group " << f.groupName << ": " << f.message;
    if (!f.quoteId.empty())
        out << " (quote " << f.quoteId << ")";
    return out;
}

bool succeeded(const CalibrationOutcome& outcome) {
    return boost::get<QuantLib::ext::shared_ptr<const CalibratedCurveGroup>>(&outcome) != nullptr;
}

QuantLib::ext::shared_ptr<const CalibratedCurveGroup> calibratedGroup(const CalibrationOutcome& outcome) {
    if (const CalibrationFailure* f = boost::get<CalibrationFailure>(&outcome))
        QL_FAIL("calibration failed: " << *f);
    return boost::get<QuantLib::ext::shared_ptr<const CalibratedCurveGroup>>(outcome);
}

boost::optional<CalibrationFailure> failure(const CalibrationOutcome& outcome) {
    if (const CalibrationFailure* f = boost::get<CalibrationFailure>(&outcome))
        return *f;
    return boost::none;
}

} // namespace analytics
} // namespace cre

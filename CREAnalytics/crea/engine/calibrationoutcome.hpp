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

/*! \file crea/engine/calibrationoutcome.hpp
    \brief Result of a calibration that may have failed
    \ingroup engine
*/

#pragma once

#include <crea/engine/calibratedcurvegroup.hpp>

#include <cve/utilities/calibrationerror.hpp>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include <ostream>
#include <string>

namespace cre {
namespace analytics {

//! Typed description of a failed calibration
struct CalibrationFailure {
    CalibrationFailure() : kind(CurveExt::CalibrationError::Kind::Other) {}
    CalibrationFailure(CurveExt::CalibrationError::Kind kind, const std::string& groupName,
                       const std::string& message, const std::string& quoteId = "")
        : kind(kind), groupName(groupName), message(message), quoteId(quoteId) {}
    CurveExt::CalibrationError::Kind kind;
    std::string groupName;
    std::string message;
    //! the missing quote for kind MissingMarketData, empty otherwise
    std::string quoteId;
};

std::ostream& operator<<(std::ostream& out, const CalibrationFailure& f);

//! Either the calibrated group or the reason why the calibration failed
typedef boost::variant<QuantLib::ext::shared_ptr<const CalibratedCurveGroup>, CalibrationFailure> CalibrationOutcome;

//! true if the outcome holds a calibrated group
bool succeeded(const CalibrationOutcome& outcome);

//! the calibrated group, throws if the calibration failed
QuantLib::ext::shared_ptr<const CalibratedCurveGroup> calibratedGroup(const CalibrationOutcome& outcome);

//! the failure, none if the calibration succeeded
boost::optional<CalibrationFailure> failure(const CalibrationOutcome& outcome);

} // namespace analytics
} // namespace cre

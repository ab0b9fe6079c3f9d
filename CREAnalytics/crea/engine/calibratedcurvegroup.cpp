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

#include <crea/engine/calibratedcurvegroup.hpp>

#include <cve/utilities/calibrationerror.hpp>

#include <ql/errors.hpp>


using namespace QuantLib;
using namespace CurveExt;
using std::string;
using std::vector;

namespace cre {
namespace analytics {

CalibratedCurveGroup::CalibratedCurveGroup(
    const string& name, const RatesCurveProvider& curves, const vector<string>& calibratedCurves,
    const vector<vector<string>>& layers, const vector<string>& quoteIds,
    const vector<QuantLib::ext::shared_ptr<const CalibrationInstrument>>& instruments, CalibrationMeasure measure,
    const Matrix& jacobian, const Array& quoteDerivatives, const vector<Size>& iterations)
    : name_(name), curves_(curves), calibratedCurves_(calibratedCurves), layers_(layers), quoteIds_(quoteIds),
      instruments_(instruments), measure_(measure), jacobian_(jacobian), quoteDerivatives_(quoteDerivatives),
      iterations_(iterations) {

    Size n = jacobian_.rows();
    QL_REQUIRE(jacobian_.columns() == n, "CalibratedCurveGroup " << name_ << ": Jacobian is not square ("
                                                                 << n << "x" << jacobian_.columns() << ")");
    QL_REQUIRE(quoteIds_.size() == n && instruments_.size() == n && quoteDerivatives_.size() == n,
               "CalibratedCurveGroup " << name_ << ": " << quoteIds_.size() << " quotes, " << instruments_.size()
                                       << " instruments and " << quoteDerivatives_.size()
                                       << " quote derivatives for " << n << " parameters");

    Size offset = 0;
    for (auto const& c : calibratedCurves_) {
        offsets_[c] = offset;
        offset += curves_.curve(c).parameterCount();
    }
    QL_REQUIRE(offset == n, "CalibratedCurveGroup " << name_ << ": " << offset << " curve parameters for " << n
                                                    << " Jacobian columns");

    // dp/dq = -J^{-1} diag(dr/dq)
    Matrix jInv;
    try {
        jInv = inverse(jacobian_);
    } catch (const std::exception& e) {
        throw SingularJacobianError("Jacobian of curve group " + name_ + " can not be inverted: " + e.what());
    }
    dParamsdQuotes_ = Matrix(n, n, 0.0);
    for (Size i = 0; i < n; ++i)
        for (Size k = 0; k < n; ++k)
            dParamsdQuotes_[i][k] = -jInv[i][k] * quoteDerivatives_[k];
}

Size CalibratedCurveGroup::parameterOffset(const string& curveName) const {
    auto it = offsets_.find(curveName);
    QL_REQUIRE(it != offsets_.end(), "CalibratedCurveGroup " << name_ << ": curve " << curveName
                                                             << " is not calibrated in this group");
    return it->second;
}

} // namespace analytics
} // namespace cre

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

#include <crea/engine/residualjacobianassembler.hpp>

#include <ql/errors.hpp>

using namespace CurveExt;
using std::string;
using std::vector;

namespace cre {
namespace analytics {

ResidualJacobianAssembler::ResidualJacobianAssembler(
    const vector<QuantLib::ext::shared_ptr<const CalibrationInstrument>>& instruments,
    const vector<string>& calibratedCurves, const vector<Size>& parameterCounts, CalibrationMeasure measure)
    : instruments_(instruments), curves_(calibratedCurves), columns_(0), measure_(measure) {
    QL_REQUIRE(curves_.size() == parameterCounts.size(), "ResidualJacobianAssembler: " << curves_.size()
                                                                                        << " curves, but "
                                                                                        << parameterCounts.size()
                                                                                        << " parameter counts");
    for (Size c = 0; c < curves_.size(); ++c) {
        QL_REQUIRE(offsets_.count(curves_[c]) == 0, "ResidualJacobianAssembler: duplicate curve " << curves_[c]);
        offsets_[curves_[c]] = columns_;
        columns_ += parameterCounts[c];
    }
    for (auto const& i : instruments_)
        QL_REQUIRE(i, "ResidualJacobianAssembler: null instrument");
}

Size ResidualJacobianAssembler::offset(const string& curveName) const {
    auto it = offsets_.find(curveName);
    QL_REQUIRE(it != offsets_.end(), "ResidualJacobianAssembler: curve " << curveName << " is not calibrated");
    return it->second;
}

void ResidualJacobianAssembler::assemble(const RatesCurveProvider& curves, Array& residuals,
                                         Matrix& jacobian) const {
    residuals = Array(rows(), 0.0);
    jacobian = Matrix(rows(), columns_, 0.0);
    for (Size k = 0; k < instruments_.size(); ++k) {
        InstrumentValue v = instruments_[k]->measure(measure_, curves);
        residuals[k] = v.value;
        for (auto const& p : v.sensitivities.entries()) {
            auto it = offsets_.find(p.curveName);
            // frozen curve
            if (it == offsets_.end())
                continue;
            Array dp = curves.curve(p.curveName).discountFactorParameterSensitivity(p.date);
            for (Size i = 0; i < dp.size(); ++i)
                jacobian[k][it->second + i] += p.sensitivity * dp[i];
        }
    }
}

Array ResidualJacobianAssembler::residuals(const RatesCurveProvider& curves) const {
    Array r(rows(), 0.0);
    for (Size k = 0; k < instruments_.size(); ++k)
        r[k] = instruments_[k]->measure(measure_, curves).value;
    return r;
}

Array ResidualJacobianAssembler::quoteDerivatives(const RatesCurveProvider& curves) const {
    Array d(rows(), 0.0);
    for (Size k = 0; k < instruments_.size(); ++k)
        d[k] = instruments_[k]->quoteSensitivity(measure_, curves);
    return d;
}

} // namespace analytics
} // namespace cre

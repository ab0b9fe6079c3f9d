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

#include <crea/engine/sensitivitypropagator.hpp>

#include <cred/utilities/log.hpp>

#include <ql/errors.hpp>

using namespace CurveExt;

namespace cre {
namespace analytics {

SensitivityPropagator::SensitivityPropagator(const QuantLib::ext::shared_ptr<const CalibratedCurveGroup>& group)
    : group_(group) {
    QL_REQUIRE(group_, "SensitivityPropagator: no calibrated curve group given");
}

CurrencyParameterSensitivities SensitivityPropagator::parameterSensitivity(const PointSensitivities& points) const {
    CurrencyParameterSensitivities result;
    for (auto const& p : points.normalized().entries()) {
        const InterpolatedParameterCurve& curve = group_->curve(p.curveName);
        Array s = curve.discountFactorParameterSensitivity(p.date);
        s *= p.sensitivity;
        result.add(CurrencyParameterSensitivity(p.curveName, p.currency, curve.parameterMetadata(), s));
    }
    return result;
}

MarketQuoteSensitivities
SensitivityPropagator::toMarketQuoteSensitivity(const CurrencyParameterSensitivities& sensitivities) const {
    const Matrix& dpdq = group_->parameterQuoteDerivatives();
    const std::vector<std::string>& quoteIds = group_->quoteIds();
    MarketQuoteSensitivities result;
    for (auto const& s : sensitivities.sensitivities()) {
        if (!group_->isCalibrated(s.curveName)) {
            DLOG("SensitivityPropagator: " << s.curveName << " is not calibrated in group " << group_->name()
                                           << ", sensitivity kept as parameter sensitivity");
            continue;
        }
        Size offset = group_->parameterOffset(s.curveName);
        QL_REQUIRE(offset + s.sensitivity.size() <= dpdq.rows(),
                   "SensitivityPropagator: " << s.sensitivity.size() << " sensitivities for curve " << s.curveName
                                             << " do not match the calibrated group");
        for (Size k = 0; k < quoteIds.size(); ++k) {
            Real q = 0.0;
            for (Size i = 0; i < s.sensitivity.size(); ++i)
                q += s.sensitivity[i] * dpdq[offset + i][k];
            if (q != 0.0)
                result.add(quoteIds[k], s.currency, q);
        }
    }
    return result;
}

MarketQuoteSensitivities SensitivityPropagator::toMarketQuoteSensitivity(const PointSensitivities& points) const {
    return toMarketQuoteSensitivity(parameterSensitivity(points));
}

CurrencyParameterSensitivities
SensitivityPropagator::seedSensitivities(const CurrencyParameterSensitivities& sensitivities) const {
    CurrencyParameterSensitivities result;
    for (auto const& s : sensitivities.sensitivities()) {
        if (!group_->isCalibrated(s.curveName))
            result.add(s);
    }
    return result;
}

} // namespace analytics
} // namespace cre

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

/*! \file crea/engine/sensitivitypropagator.hpp
    \brief Conversion of point sensitivities to parameter and market quote sensitivities
    \ingroup engine
*/

#pragma once

#include <crea/engine/calibratedcurvegroup.hpp>

#include <cve/sensitivities/marketquotesensitivities.hpp>
#include <cve/sensitivities/parametersensitivities.hpp>
#include <cve/sensitivities/pointsensitivities.hpp>

#include <ql/shared_ptr.hpp>

namespace cre {
namespace analytics {

//! Propagates sensitivities through the calibration of a curve group
/*! Point sensitivities are converted to parameter sensitivities by the chain rule with the
    discount factor sensitivities of the curves. Parameter sensitivities of calibrated curves
    are converted to market quote sensitivities with the stored derivatives of the parameters
    w.r.t. the quotes,

    \f[
        \frac{\partial V}{\partial q} = -\mathrm{diag}\left(\frac{\partial r}{\partial q}\right) J^{-T}
            \frac{\partial V}{\partial p}.
    \f]

    Sensitivities to seed curves have no quotes in the group, they stay parameter sensitivities
    and are returned by seedSensitivities().

    \ingroup engine
*/
class SensitivityPropagator {
public:
    explicit SensitivityPropagator(const QuantLib::ext::shared_ptr<const CalibratedCurveGroup>& group);

    //! parameter sensitivities of all curves (calibrated and seed) the points refer to
    CurveExt::CurrencyParameterSensitivities parameterSensitivity(const CurveExt::PointSensitivities& points) const;

    //! market quote sensitivities of the parameter sensitivities to calibrated curves
    CurveExt::MarketQuoteSensitivities
    toMarketQuoteSensitivity(const CurveExt::CurrencyParameterSensitivities& sensitivities) const;
    //! market quote sensitivities of point sensitivities
    CurveExt::MarketQuoteSensitivities toMarketQuoteSensitivity(const CurveExt::PointSensitivities& points) const;

    //! the sensitivities to curves that are not calibrated in the group
    CurveExt::CurrencyParameterSensitivities
    seedSensitivities(const CurveExt::CurrencyParameterSensitivities& sensitivities) const;

    const QuantLib::ext::shared_ptr<const CalibratedCurveGroup>& group() const { return group_; }

private:
    QuantLib::ext::shared_ptr<const CalibratedCurveGroup> group_;
};

} // namespace analytics
} // namespace cre

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

#include <cve/instruments/forwardrateagreement.hpp>

#include <ql/errors.hpp>

using namespace QuantLib;

namespace CurveExt {

ForwardRateAgreement::ForwardRateAgreement(const std::string& currency, const std::string& index,
                                           const Date& startDate, const Date& endDate, Time yearFraction, Real rate)
    : CalibrationInstrument(currency, rate), index_(index), startDate_(startDate), endDate_(endDate),
      yearFraction_(yearFraction) {
    QL_REQUIRE(startDate_ < endDate_, "ForwardRateAgreement: start date " << io::iso_date(startDate_)
                                                                          << " must be before end date "
                                                                          << io::iso_date(endDate_));
}

InstrumentValue ForwardRateAgreement::presentValue(const RatesCurveProvider& provider) const {
    const InterpolatedParameterCurve& dc = provider.discountCurve(currency_);
    const InterpolatedParameterCurve& fc = provider.indexCurve(index_);
    ForwardRate f = forwardRate(fc, startDate_, endDate_, yearFraction_);
    Real ds = dc.discountFactor(startDate_);
    Real tau = yearFraction_;
    Real den = 1.0 + tau * f.rate;
    PointSensitivities s;
    addSensitivity(s, dc, startDate_, tau * (f.rate - fixedRate_) / den, currency_);
    addForwardRateSensitivity(s, fc, startDate_, endDate_, f, ds * tau * (1.0 + tau * fixedRate_) / (den * den),
                              currency_);
    return InstrumentValue(ds * tau * (f.rate - fixedRate_) / den, s);
}

InstrumentValue ForwardRateAgreement::annuity(const RatesCurveProvider& provider) const {
    const InterpolatedParameterCurve& dc = provider.discountCurve(currency_);
    const InterpolatedParameterCurve& fc = provider.indexCurve(index_);
    ForwardRate f = forwardRate(fc, startDate_, endDate_, yearFraction_);
    Real ds = dc.discountFactor(startDate_);
    Real tau = yearFraction_;
    Real den = 1.0 + tau * f.rate;
    PointSensitivities s;
    addSensitivity(s, dc, startDate_, tau / den, currency_);
    addForwardRateSensitivity(s, fc, startDate_, endDate_, f, -ds * tau * tau / (den * den), currency_);
    return InstrumentValue(ds * tau / den, s);
}

} // namespace CurveExt

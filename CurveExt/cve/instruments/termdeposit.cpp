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

#include <cve/instruments/termdeposit.hpp>

#include <ql/errors.hpp>

using namespace QuantLib;

namespace CurveExt {

TermDeposit::TermDeposit(const std::string& currency, const Date& startDate, const Date& endDate, Time yearFraction,
                         Real rate)
    : CalibrationInstrument(currency, rate), startDate_(startDate), endDate_(endDate), yearFraction_(yearFraction) {
    QL_REQUIRE(startDate_ < endDate_, "TermDeposit: start date " << io::iso_date(startDate_)
                                                                 << " must be before end date "
                                                                 << io::iso_date(endDate_));
    QL_REQUIRE(yearFraction_ > 0.0, "TermDeposit: year fraction (" << yearFraction_ << ") must be positive");
}

InstrumentValue TermDeposit::presentValue(const RatesCurveProvider& provider) const {
    const InterpolatedParameterCurve& dc = provider.discountCurve(currency_);
    Real ds = dc.discountFactor(startDate_);
    Real de = dc.discountFactor(endDate_);
    Real growth = 1.0 + yearFraction_ * fixedRate_;
    PointSensitivities s;
    addSensitivity(s, dc, startDate_, 1.0, currency_);
    addSensitivity(s, dc, endDate_, -growth, currency_);
    return InstrumentValue(ds - de * growth, s);
}

InstrumentValue TermDeposit::annuity(const RatesCurveProvider& provider) const {
    const InterpolatedParameterCurve& dc = provider.discountCurve(currency_);
    PointSensitivities s;
    addSensitivity(s, dc, endDate_, yearFraction_, currency_);
    return InstrumentValue(yearFraction_ * dc.discountFactor(endDate_), s);
}

} // namespace CurveExt

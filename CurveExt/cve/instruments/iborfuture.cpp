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

#include <cve/instruments/iborfuture.hpp>

#include <ql/errors.hpp>

using namespace QuantLib;

namespace CurveExt {

IborFuture::IborFuture(const std::string& currency, const std::string& index, const Date& lastTradeDate,
                       const Date& startDate, const Date& endDate, Time yearFraction, Real price)
    : CalibrationInstrument(currency, price), index_(index), lastTradeDate_(lastTradeDate), startDate_(startDate),
      endDate_(endDate), yearFraction_(yearFraction) {
    QL_REQUIRE(startDate_ < endDate_, "IborFuture: start date " << io::iso_date(startDate_)
                                                                << " must be before end date "
                                                                << io::iso_date(endDate_));
    QL_REQUIRE(lastTradeDate_ <= startDate_, "IborFuture: last trade date " << io::iso_date(lastTradeDate_)
                                                                            << " is after the start date "
                                                                            << io::iso_date(startDate_));
}

InstrumentValue IborFuture::presentValue(const RatesCurveProvider& provider) const {
    const InterpolatedParameterCurve& fc = provider.indexCurve(index_);
    ForwardRate f = forwardRate(fc, startDate_, endDate_, yearFraction_);
    PointSensitivities s;
    addForwardRateSensitivity(s, fc, startDate_, endDate_, f, -yearFraction_, currency_);
    return InstrumentValue(yearFraction_ * (1.0 - f.rate - fixedRate_), s);
}

InstrumentValue IborFuture::annuity(const RatesCurveProvider&) const {
    return InstrumentValue(yearFraction_, PointSensitivities());
}

} // namespace CurveExt

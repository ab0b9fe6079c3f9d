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

#include <cve/instruments/calibrationinstrument.hpp>

#include <ql/errors.hpp>

using namespace QuantLib;

namespace CurveExt {

std::ostream& operator<<(std::ostream& out, CalibrationMeasure m) {
    switch (m) {
    case CalibrationMeasure::ParSpread:
        return out << "ParSpread";
    case CalibrationMeasure::PresentValue:
        return out << "PresentValue";
    }
    QL_FAIL("unknown calibration measure");
}

InstrumentValue CalibrationInstrument::parSpread(const RatesCurveProvider& provider) const {
    InstrumentValue pv = presentValue(provider);
    InstrumentValue a = annuity(provider);
    QL_REQUIRE(a.value != 0.0, "CalibrationInstrument: zero annuity, par spread is not defined");
    Real ps = pv.value / a.value;
    // d(pv/a) = (dpv - ps da) / a
    PointSensitivities s =
        pv.sensitivities.multipliedBy(1.0 / a.value).combinedWith(a.sensitivities.multipliedBy(-ps / a.value));
    return InstrumentValue(ps, s.normalized());
}

InstrumentValue CalibrationInstrument::measure(CalibrationMeasure m, const RatesCurveProvider& provider) const {
    switch (m) {
    case CalibrationMeasure::ParSpread:
        return parSpread(provider);
    case CalibrationMeasure::PresentValue: {
        InstrumentValue pv = presentValue(provider);
        return InstrumentValue(pv.value, pv.sensitivities.normalized());
    }
    }
    QL_FAIL("unknown calibration measure");
}

Real CalibrationInstrument::quoteSensitivity(CalibrationMeasure m, const RatesCurveProvider& provider) const {
    // the present value is linear in the quoted rate with slope -annuity
    switch (m) {
    case CalibrationMeasure::ParSpread:
        return -quoteScale();
    case CalibrationMeasure::PresentValue:
        return -annuity(provider).value * quoteScale();
    }
    QL_FAIL("unknown calibration measure");
}

void CalibrationInstrument::addSensitivity(PointSensitivities& s, const InterpolatedParameterCurve& curve,
                                           const Date& d, Real sensitivity, const std::string& currency) {
    s.add(curve.name(), d, curve.timeFromReference(d), sensitivity, currency);
}

CalibrationInstrument::ForwardRate CalibrationInstrument::forwardRate(const InterpolatedParameterCurve& curve,
                                                                      const Date& start, const Date& end, Time tau) {
    QL_REQUIRE(tau > 0.0, "CalibrationInstrument: non-positive accrual " << tau << " for forward rate from "
                                                                         << io::iso_date(start) << " to "
                                                                         << io::iso_date(end));
    Real ds = curve.discountFactor(start);
    Real de = curve.discountFactor(end);
    ForwardRate f;
    f.rate = (ds / de - 1.0) / tau;
    f.dStart = 1.0 / (tau * de);
    f.dEnd = -ds / (tau * de * de);
    return f;
}

void CalibrationInstrument::addForwardRateSensitivity(PointSensitivities& s, const InterpolatedParameterCurve& curve,
                                                      const Date& start, const Date& end, const ForwardRate& f,
                                                      Real factor, const std::string& currency) {
    addSensitivity(s, curve, start, factor * f.dStart, currency);
    addSensitivity(s, curve, end, factor * f.dEnd, currency);
}

} // namespace CurveExt

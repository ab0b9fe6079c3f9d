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

#include <cve/instruments/interestrateswap.hpp>

#include <ql/errors.hpp>

#include <algorithm>

using namespace QuantLib;

namespace CurveExt {

std::ostream& operator<<(std::ostream& out, SwapLeg::Type t) {
    switch (t) {
    case SwapLeg::Type::Fixed:
        return out << "Fixed";
    case SwapLeg::Type::Ibor:
        return out << "Ibor";
    case SwapLeg::Type::Overnight:
        return out << "Overnight";
    }
    QL_FAIL("unknown swap leg type");
}

SwapLeg::SwapLeg(Type type, const std::vector<SwapPeriod>& periods, const std::string& index, Real spread)
    : type_(type), periods_(periods), index_(index), spread_(spread) {
    QL_REQUIRE(!periods_.empty(), "SwapLeg: no periods given");
    QL_REQUIRE(type_ == Type::Fixed || !index_.empty(), "SwapLeg: index required for " << type_ << " leg");
    for (auto const& p : periods_) {
        QL_REQUIRE(p.yearFraction > 0.0, "SwapLeg: non-positive year fraction " << p.yearFraction
                                                                                << " for period starting "
                                                                                << io::iso_date(p.accrualStart));
        QL_REQUIRE(type_ == Type::Fixed || p.fixingStart < p.fixingEnd,
                   "SwapLeg: invalid fixing period for accrual period starting " << io::iso_date(p.accrualStart));
    }
}

InstrumentValue SwapLeg::presentValue(const RatesCurveProvider& provider, const std::string& currency,
                                      Real extraSpread) const {
    const InterpolatedParameterCurve& dc = provider.discountCurve(currency);
    const InterpolatedParameterCurve* fc = isFloating() ? &provider.indexCurve(index_) : nullptr;
    Real pv = 0.0;
    PointSensitivities s;
    for (auto const& p : periods_) {
        Real df = dc.discountFactor(p.paymentDate);
        Real coupon = spread_ + extraSpread;
        if (fc) {
            CalibrationInstrument::ForwardRate f =
                CalibrationInstrument::forwardRate(*fc, p.fixingStart, p.fixingEnd, p.fixingYearFraction);
            coupon += f.rate;
            CalibrationInstrument::addForwardRateSensitivity(s, *fc, p.fixingStart, p.fixingEnd, f,
                                                             p.yearFraction * df, currency);
        }
        pv += coupon * p.yearFraction * df;
        CalibrationInstrument::addSensitivity(s, dc, p.paymentDate, coupon * p.yearFraction, currency);
    }
    return InstrumentValue(pv, s);
}

InstrumentValue SwapLeg::annuity(const RatesCurveProvider& provider, const std::string& currency) const {
    const InterpolatedParameterCurve& dc = provider.discountCurve(currency);
    Real a = 0.0;
    PointSensitivities s;
    for (auto const& p : periods_) {
        a += p.yearFraction * dc.discountFactor(p.paymentDate);
        CalibrationInstrument::addSensitivity(s, dc, p.paymentDate, p.yearFraction, currency);
    }
    return InstrumentValue(a, s);
}

InterestRateSwap::InterestRateSwap(const std::string& currency, const SwapLeg& quotedLeg, const SwapLeg& otherLeg,
                                   Real rate, Real notional)
    : CalibrationInstrument(currency, rate), quotedLeg_(quotedLeg), otherLeg_(otherLeg), notional_(notional) {}

InstrumentValue InterestRateSwap::presentValue(const RatesCurveProvider& provider) const {
    InstrumentValue receive = otherLeg_.presentValue(provider, currency_, 0.0);
    InstrumentValue pay = quotedLeg_.presentValue(provider, currency_, fixedRate_);
    return InstrumentValue(notional_ * (receive.value - pay.value),
                           receive.sensitivities.multipliedBy(notional_).combinedWith(
                               pay.sensitivities.multipliedBy(-notional_)));
}

InstrumentValue InterestRateSwap::annuity(const RatesCurveProvider& provider) const {
    InstrumentValue a = quotedLeg_.annuity(provider, currency_);
    return InstrumentValue(notional_ * a.value, a.sensitivities.multipliedBy(notional_));
}

std::set<std::string> InterestRateSwap::indices() const {
    std::set<std::string> result;
    if (quotedLeg_.isFloating())
        result.insert(quotedLeg_.index());
    if (otherLeg_.isFloating())
        result.insert(otherLeg_.index());
    return result;
}

Date InterestRateSwap::maturityDate() const {
    Date d;
    for (auto const& p : quotedLeg_.periods())
        d = std::max(d, std::max(p.paymentDate, p.fixingEnd));
    for (auto const& p : otherLeg_.periods())
        d = std::max(d, std::max(p.paymentDate, p.fixingEnd));
    return d;
}

} // namespace CurveExt

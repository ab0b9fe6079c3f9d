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

/*! \file cve/instruments/interestrateswap.hpp
    \brief Single currency swap with fixed, ibor or overnight legs
    \ingroup instruments
*/

#ifndef curveext_interestrateswap_hpp
#define curveext_interestrateswap_hpp

#include <cve/instruments/calibrationinstrument.hpp>

#include <vector>

namespace CurveExt {

//! Accrual period of a swap leg
/*! For floating legs the projection period of the index is given by the fixing dates, for an
    overnight leg compounded over the accrual period the fixing dates are the accrual dates.
*/
struct SwapPeriod {
    SwapPeriod() : yearFraction(0.0), fixingYearFraction(0.0) {}
    SwapPeriod(const Date& accrualStart, const Date& accrualEnd, const Date& paymentDate, Time yearFraction,
               const Date& fixingStart = Date(), const Date& fixingEnd = Date(), Time fixingYearFraction = 0.0)
        : accrualStart(accrualStart), accrualEnd(accrualEnd), paymentDate(paymentDate), yearFraction(yearFraction),
          fixingStart(fixingStart), fixingEnd(fixingEnd), fixingYearFraction(fixingYearFraction) {}

    Date accrualStart, accrualEnd, paymentDate;
    Time yearFraction;
    Date fixingStart, fixingEnd;
    Time fixingYearFraction;
};

//! Swap leg, the coupon of each period is the projected index rate (zero for fixed legs) plus the spread
class SwapLeg {
public:
    enum class Type { Fixed, Ibor, Overnight };

    SwapLeg(Type type, const std::vector<SwapPeriod>& periods, const std::string& index = "", Real spread = 0.0);

    Type type() const { return type_; }
    const std::vector<SwapPeriod>& periods() const { return periods_; }
    const std::string& index() const { return index_; }
    Real spread() const { return spread_; }
    bool isFloating() const { return type_ != Type::Fixed; }

    //! present value with extraSpread added to each coupon, with point sensitivities
    InstrumentValue presentValue(const RatesCurveProvider& provider, const std::string& currency,
                                 Real extraSpread) const;
    //! sum of year fraction times discount factor over all periods
    InstrumentValue annuity(const RatesCurveProvider& provider, const std::string& currency) const;

private:
    Type type_;
    std::vector<SwapPeriod> periods_;
    std::string index_;
    Real spread_;
};

std::ostream& operator<<(std::ostream& out, SwapLeg::Type t);

//! Swap paying the quoted leg and receiving the other leg
/*! The quoted rate is added to the coupons of the quoted leg, i.e. it is the fixed rate of a
    fixed vs floating swap or the spread over the index of a basis swap. The present value is
    \f[
        N \left( PV_{other} - PV_{quoted}(K) \right)
    \f]
    with notional \f$ N \f$, so the annuity is \f$ N \sum \tau_i P(t_i) \f$ over the quoted leg.

    \ingroup instruments
*/
class InterestRateSwap : public CalibrationInstrument {
public:
    InterestRateSwap(const std::string& currency, const SwapLeg& quotedLeg, const SwapLeg& otherLeg, Real rate,
                     Real notional = 1.0);

    InstrumentValue presentValue(const RatesCurveProvider& provider) const override;
    InstrumentValue annuity(const RatesCurveProvider& provider) const override;
    std::set<std::string> discountCurrencies() const override { return {currency_}; }
    std::set<std::string> indices() const override;
    Date maturityDate() const override;

    const SwapLeg& quotedLeg() const { return quotedLeg_; }
    const SwapLeg& otherLeg() const { return otherLeg_; }
    Real notional() const { return notional_; }

private:
    SwapLeg quotedLeg_, otherLeg_;
    Real notional_;
};

} // namespace CurveExt

#endif

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

/*! \file cve/instruments/calibrationinstrument.hpp
    \brief Base class of instruments used to calibrate interest rate curves
    \ingroup instruments
*/

#ifndef curveext_calibrationinstrument_hpp
#define curveext_calibrationinstrument_hpp

#include <cve/sensitivities/pointsensitivities.hpp>
#include <cve/termstructures/ratescurveprovider.hpp>

#include <ql/time/date.hpp>

#include <ostream>
#include <set>
#include <string>

namespace CurveExt {

class SwapLeg;

//! Quantity which is set to zero by the calibration
/*! ParSpread is the spread to the quoted rate or price which makes the present value zero,
    PresentValue is the present value for a unit notional.
*/
enum class CalibrationMeasure { ParSpread, PresentValue };

std::ostream& operator<<(std::ostream& out, CalibrationMeasure m);

//! A value together with its derivatives w.r.t. the discount factors it depends on
struct InstrumentValue {
    InstrumentValue() : value(0.0) {}
    InstrumentValue(Real value, const PointSensitivities& sensitivities) : value(value), sensitivities(sensitivities) {}
    Real value;
    PointSensitivities sensitivities;
};

//! Instrument priced by discounting for the calibration of curves
/*! Derived classes implement the present value of the instrument per unit notional and the
    annuity, i.e. the negative derivative of the present value w.r.t. the quoted rate. Both come
    with their exact point sensitivities. The present value is linear in the quoted rate, so
    that the par spread is the ratio of present value and annuity.

    The instrument is quoted by a market quote \f$ q \f$, the quoted rate is \f$ K = q s \f$ plus
    a spread, where the scale \f$ s \f$ is given by quoteScale().

    \ingroup instruments
*/
class CalibrationInstrument {
public:
    CalibrationInstrument(const std::string& currency, Real fixedRate) : currency_(currency), fixedRate_(fixedRate) {}
    virtual ~CalibrationInstrument() {}

    //! \name Interface
    //@{
    virtual InstrumentValue presentValue(const RatesCurveProvider& provider) const = 0;
    //! derivative of the present value w.r.t. the quoted rate, with the opposite sign
    virtual InstrumentValue annuity(const RatesCurveProvider& provider) const = 0;
    //! currencies whose discount curves the instrument uses
    virtual std::set<std::string> discountCurrencies() const = 0;
    //! indices whose forwarding curves the instrument uses
    virtual std::set<std::string> indices() const = 0;
    //! last date on which the instrument depends
    virtual Date maturityDate() const = 0;
    //! derivative of the quoted rate w.r.t. the market quote
    virtual Real quoteScale() const { return 1.0; }
    //@}

    //! present value divided by the annuity
    InstrumentValue parSpread(const RatesCurveProvider& provider) const;
    InstrumentValue measure(CalibrationMeasure m, const RatesCurveProvider& provider) const;
    //! derivative of the measure w.r.t. the market quote of the instrument
    Real quoteSensitivity(CalibrationMeasure m, const RatesCurveProvider& provider) const;

    const std::string& currency() const { return currency_; }
    //! the quoted rate (or price fraction) including the node spread
    Real fixedRate() const { return fixedRate_; }

protected:
    friend class SwapLeg;

    //! adds the sensitivity to the discount factor of curve at date d
    static void addSensitivity(PointSensitivities& s, const InterpolatedParameterCurve& curve, const Date& d,
                               Real sensitivity, const std::string& currency);

    //! simply compounded forward rate and its derivatives w.r.t. the discount factors at start and end
    struct ForwardRate {
        Real rate;
        Real dStart;
        Real dEnd;
    };

    static ForwardRate forwardRate(const InterpolatedParameterCurve& curve, const Date& start, const Date& end,
                                   Time tau);
    //! adds factor times the sensitivities of the forward rate f of curve
    static void addForwardRateSensitivity(PointSensitivities& s, const InterpolatedParameterCurve& curve,
                                          const Date& start, const Date& end, const ForwardRate& f, Real factor,
                                          const std::string& currency);

    std::string currency_;
    Real fixedRate_;
};

} // namespace CurveExt

#endif

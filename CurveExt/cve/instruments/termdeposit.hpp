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

/*! \file cve/instruments/termdeposit.hpp
    \brief Fixed rate term deposit
    \ingroup instruments
*/

#ifndef curveext_termdeposit_hpp
#define curveext_termdeposit_hpp

#include <cve/instruments/calibrationinstrument.hpp>

namespace CurveExt {

//! Deposit of a unit notional at a fixed rate
/*! The depositor pays the notional at the start date and receives the notional plus interest at
    the end date, the present value is
    \f[
        P(t_s) - P(t_e) (1 + \tau K)
    \f]
    on the discount curve of the deposit currency.

    \ingroup instruments
*/
class TermDeposit : public CalibrationInstrument {
public:
    TermDeposit(const std::string& currency, const Date& startDate, const Date& endDate, Time yearFraction,
                Real rate);

    InstrumentValue presentValue(const RatesCurveProvider& provider) const override;
    InstrumentValue annuity(const RatesCurveProvider& provider) const override;
    std::set<std::string> discountCurrencies() const override { return {currency_}; }
    std::set<std::string> indices() const override { return {}; }
    Date maturityDate() const override { return endDate_; }

    const Date& startDate() const { return startDate_; }
    const Date& endDate() const { return endDate_; }
    Time yearFraction() const { return yearFraction_; }

private:
    Date startDate_, endDate_;
    Time yearFraction_;
};

} // namespace CurveExt

#endif

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

/*! \file cve/instruments/iborfixingdeposit.hpp
    \brief Deposit exchanging an ibor fixing against a fixed rate
    \ingroup instruments
*/

#ifndef curveext_iborfixingdeposit_hpp
#define curveext_iborfixingdeposit_hpp

#include <cve/instruments/calibrationinstrument.hpp>

namespace CurveExt {

//! Deposit paying the fixing of an ibor index against a fixed rate at the end of the index period
/*! The present value is \f$ \tau P(t_e) (L - K) \f$ where \f$ L \f$ is the forward rate of the
    index curve over the index period and \f$ P \f$ the discount curve of the currency. The
    instrument is used to pin down the short end of a forwarding curve.

    \ingroup instruments
*/
class IborFixingDeposit : public CalibrationInstrument {
public:
    IborFixingDeposit(const std::string& currency, const std::string& index, const Date& startDate,
                      const Date& endDate, Time yearFraction, Real rate);

    InstrumentValue presentValue(const RatesCurveProvider& provider) const override;
    InstrumentValue annuity(const RatesCurveProvider& provider) const override;
    std::set<std::string> discountCurrencies() const override { return {currency_}; }
    std::set<std::string> indices() const override { return {index_}; }
    Date maturityDate() const override { return endDate_; }

    const std::string& index() const { return index_; }
    const Date& startDate() const { return startDate_; }
    const Date& endDate() const { return endDate_; }

private:
    std::string index_;
    Date startDate_, endDate_;
    Time yearFraction_;
};

} // namespace CurveExt

#endif

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

/*! \file cve/instruments/iborfuture.hpp
    \brief Money market future on an ibor index
    \ingroup instruments
*/

#ifndef curveext_iborfuture_hpp
#define curveext_iborfuture_hpp

#include <cve/instruments/calibrationinstrument.hpp>

namespace CurveExt {

//! Daily margined future on the fixing of an ibor index
/*! The future is quoted as a price, e.g. 99.25, the fixed rate of the instrument is the price
    as a fraction, i.e. quoteScale() is 0.01. Without convexity adjustment the value of a long
    position per unit notional is
    \f[
        \tau (1 - L - K)
    \f]
    where \f$ L \f$ is the forward rate of the index over the reference period. Futures are
    margined, so no discount curve is used.

    \ingroup instruments
*/
class IborFuture : public CalibrationInstrument {
public:
    IborFuture(const std::string& currency, const std::string& index, const Date& lastTradeDate,
               const Date& startDate, const Date& endDate, Time yearFraction, Real price);

    InstrumentValue presentValue(const RatesCurveProvider& provider) const override;
    InstrumentValue annuity(const RatesCurveProvider& provider) const override;
    std::set<std::string> discountCurrencies() const override { return {}; }
    std::set<std::string> indices() const override { return {index_}; }
    Date maturityDate() const override { return endDate_; }
    Real quoteScale() const override { return 0.01; }

    const std::string& index() const { return index_; }
    const Date& lastTradeDate() const { return lastTradeDate_; }
    const Date& startDate() const { return startDate_; }
    const Date& endDate() const { return endDate_; }

private:
    std::string index_;
    Date lastTradeDate_, startDate_, endDate_;
    Time yearFraction_;
};

} // namespace CurveExt

#endif

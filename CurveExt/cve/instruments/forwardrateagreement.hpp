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

/*! \file cve/instruments/forwardrateagreement.hpp
    \brief Forward rate agreement on an ibor index
    \ingroup instruments
*/

#ifndef curveext_forwardrateagreement_hpp
#define curveext_forwardrateagreement_hpp

#include <cve/instruments/calibrationinstrument.hpp>

namespace CurveExt {

//! FRA with settlement at the start of the index period
/*! The present value for the buyer is
    \f[
        P(t_s) \frac{\tau (L - K)}{1 + \tau L}
    \f]
    where \f$ L \f$ is the forward rate of the index curve over the index period and \f$ P \f$
    the discount curve of the currency.

    \ingroup instruments
*/
class ForwardRateAgreement : public CalibrationInstrument {
public:
    ForwardRateAgreement(const std::string& currency, const std::string& index, const Date& startDate,
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

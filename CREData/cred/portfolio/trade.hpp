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

/*! \file cred/portfolio/trade.hpp
    \brief Linear rates trade priced on calibrated curves
    \ingroup portfolio
*/

#pragma once

#include <cred/builders/calibrationinstrumentbuilder.hpp>
#include <cred/configuration/curvenode.hpp>
#include <cred/utilities/xmlutils.hpp>

#include <cve/instruments/calibrationinstrument.hpp>
#include <cve/termstructures/ratescurveprovider.hpp>

#include <ql/shared_ptr.hpp>

namespace cre {
namespace data {

//! Trade on one of the curve node instruments
/*! The trade is described like a curve node instrument with a fixed rate (a price in percent
    for futures) instead of a market quote, and a notional. The trade value is the notional
    times the value of the instrument for unit notional, i.e. a positive notional pays the
    fixed rate of a swap. build() derives the instrument from the conventions.

    \ingroup portfolio
*/
class Trade : public XMLSerializable {
public:
    Trade() : rate_(0.0), notional_(1.0) {}
    Trade(const string& id, const CurveNodeInstrument& instrument, Real rate, Real notional = 1.0);

    const string& id() const { return id_; }
    const CurveNodeInstrument& instrument() const { return instrument_; }
    Real rate() const { return rate_; }
    Real notional() const { return notional_; }
    string tradeType() const;

    void build(const CalibrationInstrumentBuilder& builder, const Date& valuationDate);
    bool isBuilt() const { return calibrationInstrument_ != nullptr; }
    //! the built instrument for unit notional
    const QuantLib::ext::shared_ptr<CurveExt::CalibrationInstrument>& calibrationInstrument() const;
    Date maturity() const { return calibrationInstrument()->maturityDate(); }
    const string& currency() const { return calibrationInstrument()->currency(); }

    //! value and point sensitivities for the notional
    CurveExt::InstrumentValue presentValue(const CurveExt::RatesCurveProvider& provider) const;

    void fromXML(XMLNode* node) override;
    XMLNode* toXML(XMLDocument& doc) const override;

private:
    string id_;
    CurveNodeInstrument instrument_;
    Real rate_;
    Real notional_;
    QuantLib::ext::shared_ptr<CurveExt::CalibrationInstrument> calibrationInstrument_;
};

} // namespace data
} // namespace cre

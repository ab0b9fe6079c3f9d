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

/*! \file cred/builders/calibrationinstrumentbuilder.hpp
    \brief Builder that turns curve nodes into calibration instruments
    \ingroup builders
*/

#pragma once

#include <cred/configuration/conventions.hpp>
#include <cred/configuration/curvenode.hpp>
#include <cred/marketdata/marketquotes.hpp>

#include <cve/instruments/calibrationinstrument.hpp>
#include <cve/sensitivities/parametermetadata.hpp>
#include <cve/termstructures/interpolatedparametercurve.hpp>

#include <ql/shared_ptr.hpp>

namespace cre {
namespace data {

//! A calibration instrument with the initial guess of the parameter of its node
struct BuiltInstrument {
    QuantLib::ext::shared_ptr<CurveExt::CalibrationInstrument> instrument;
    //! initial guess consistent with the value type of the curve
    Real initialGuess;
    //! the node date, i.e. the abscissa of the node's parameter
    Date nodeDate;
    CurveExt::ParameterMetadata metadata;
};

//! Builds calibration instruments from curve nodes
/*! The instrument dates are derived from the valuation date and the conventions, the quoted
    rate is the market quote plus the node spread. Futures are quoted as prices in percent, the
    price fraction is the quote divided by 100 plus the spread.

    The builder is stateless apart from the conventions, build() does not modify anything.
    A quote that is missing raises a MissingMarketDataError, a missing convention, a convention
    of the wrong type or a malformed combination of dates raises an InvalidCurveNodeError.

    \ingroup builders
*/
class CalibrationInstrumentBuilder {
public:
    explicit CalibrationInstrumentBuilder(const QuantLib::ext::shared_ptr<Conventions>& conventions);

    //! instrument and initial guess of the node
    BuiltInstrument build(const CurveNode& node, const Date& valuationDate, const MarketQuotes& quotes,
                          CurveExt::CurveValueType valueType) const;

    //! the instrument for the given rate, a price fraction for futures, e.g. to price a trade
    QuantLib::ext::shared_ptr<CurveExt::CalibrationInstrument>
    instrument(const CurveNodeInstrument& instrument, const Date& valuationDate, Real rate) const;

    //! the node date, does not need a quote
    Date nodeDate(const CurveNode& node, const Date& valuationDate) const;

    //! the label (the node's label or a default derived from the instrument) and the node date
    CurveExt::ParameterMetadata metadata(const CurveNode& node, const Date& valuationDate) const;

    const QuantLib::ext::shared_ptr<Conventions>& conventions() const { return conventions_; }

private:
    QuantLib::ext::shared_ptr<Conventions> conventions_;
};

//! initial guess for a node with the given rate and time to the node date
Real initialGuess(CurveExt::CurveValueType valueType, Real rate, QuantLib::Time t);

} // namespace data
} // namespace cre

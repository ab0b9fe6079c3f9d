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

/*! \file crea/engine/calibrationreport.hpp
    \brief Reports on calibrated curve groups and their sensitivities
    \ingroup engine
*/

#pragma once

#include <crea/engine/calibratedcurvegroup.hpp>
#include <crea/engine/calibrationoutcome.hpp>

#include <cred/report/report.hpp>

#include <cve/sensitivities/marketquotesensitivities.hpp>
#include <cve/sensitivities/parametersensitivities.hpp>

#include <string>
#include <vector>

namespace cre {
namespace analytics {

//! Writes calibration results to reports
/*! All methods write the header and the rows and close the report with end().
    \ingroup engine
*/
class CalibrationReportWriter {
public:
    explicit CalibrationReportWriter(const std::string& nullString = "#N/A") : nullString_(nullString) {}
    virtual ~CalibrationReportWriter() {}

    //! one row per curve node: parameter, discount factor and continuously compounded zero rate
    virtual void writeCurves(data::Report& report, const CalibratedCurveGroup& group);

    /*! one row per pair of calibration instrument and curve parameter, with the entry of the
        Jacobian and the derivative of the parameter w.r.t. the quote of the instrument */
    virtual void writeJacobian(data::Report& report, const CalibratedCurveGroup& group);

    virtual void writeParameterSensitivities(data::Report& report,
                                             const CurveExt::CurrencyParameterSensitivities& sensitivities);

    virtual void writeMarketQuoteSensitivities(data::Report& report,
                                               const CurveExt::MarketQuoteSensitivities& sensitivities);

    //! status of each scenario of a batch
    virtual void writeScenarioOutcomes(data::Report& report, const std::vector<CalibrationOutcome>& outcomes);

    const std::string& nullString() const { return nullString_; }

protected:
    std::string nullString_;
};

} // namespace analytics
} // namespace cre

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

/*! \file crea/app/creapp.hpp
    \brief Curve calibration and market quote risk application
    \ingroup app
*/

#pragma once

#include <crea/app/parameters.hpp>
#include <crea/engine/calibratedcurvegroup.hpp>
#include <crea/engine/calibrationoutcome.hpp>
#include <crea/engine/curvecalibrator.hpp>

#include <cred/configuration/calibrationconfig.hpp>
#include <cred/configuration/conventions.hpp>
#include <cred/configuration/curvedefinition.hpp>
#include <cred/marketdata/csvloader.hpp>
#include <cred/portfolio/portfolio.hpp>
#include <cred/report/inmemoryreport.hpp>

#include <boost/timer/timer.hpp>

#include <map>
#include <set>
#include <vector>

namespace cre {
namespace analytics {

//! Orchestrates the calibration of the configured curve groups and the analytics on top
/*! The application reads the conventions, the curve group definitions, the calibration
    configuration, the market data and optionally a portfolio from the files named in the setup
    group of the parameters. The curve groups listed in the markets group are calibrated in the
    given order, each against the curves of the groups calibrated before it. The analytics

    - curves: curve and Jacobian reports
    - npv: trade values
    - sensitivity: market quote and seed curve parameter sensitivities of the trades
    - scenario: calibration of one curve group for every date of the market data

    are run if active and their reports are written to the output path.

    \ingroup app
*/
class CREApp {
public:
    CREApp(const QuantLib::ext::shared_ptr<Parameters>& params, bool console = false)
        : params_(params), console_(console) {}
    virtual ~CREApp();

    //! runs the analytics and writes the reports, returns 0 on success and 1 on failure
    int run();

    const std::map<string, QuantLib::ext::shared_ptr<const CalibratedCurveGroup>>& calibratedGroups() const {
        return calibratedGroups_;
    }
    const std::vector<CalibrationFailure>& failures() const { return failures_; }

    std::set<string> getReportNames() const;
    QuantLib::ext::shared_ptr<InMemoryReport> getReport(const string& reportName) const;

    //! time for executing run() in seconds
    Real getRunTime() const;

protected:
    virtual void analytics();

    void loadInputs();
    void calibrateCurveGroups();
    void runNpv();
    void runSensitivity();
    void runScenarios();

    //! provider with the curves of all calibrated groups
    CurveExt::RatesCurveProvider curves() const;
    //! the calibrated group whose curves project or discount the trade
    QuantLib::ext::shared_ptr<const CalibratedCurveGroup> groupForTrade(const Trade& trade) const;

    void setupLog(const string& path, const string& file, QuantLib::Size mask);
    void closeLog();
    void writeReport(const string& name, const string& fileName);
    void console(const string& text) const;

    QuantLib::ext::shared_ptr<Parameters> params_;
    bool console_;
    string outputPath_;
    Date asof_;

    QuantLib::ext::shared_ptr<Conventions> conventions_;
    CurveGroupDefinitions curveGroups_;
    CalibrationConfig calibrationConfig_;
    QuantLib::ext::shared_ptr<CSVLoader> loader_;
    Portfolio portfolio_;
    QuantLib::ext::shared_ptr<CurveCalibrator> calibrator_;

    std::vector<string> groupOrder_;
    std::map<string, QuantLib::ext::shared_ptr<const CalibratedCurveGroup>> calibratedGroups_;
    std::vector<CalibrationFailure> failures_;
    std::map<string, QuantLib::ext::shared_ptr<InMemoryReport>> reports_;

    boost::timer::cpu_timer runTimer_;
};

} // namespace analytics
} // namespace cre

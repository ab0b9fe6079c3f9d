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

#include <crea/app/creapp.hpp>
#include <crea/engine/calibrationreport.hpp>
#include <crea/engine/scenariocalibrationengine.hpp>
#include <crea/engine/sensitivitypropagator.hpp>

#include <cred/utilities/log.hpp>
#include <cred/utilities/parsers.hpp>
#include <cred/utilities/to_string.hpp>

#include <cve/version.hpp>

#include <ql/errors.hpp>
#include <ql/time/daycounters/actual365fixed.hpp>

#include <boost/filesystem.hpp>

#include <iostream>
#include <mutex>

using namespace CurveExt;
using boost::timer::default_places;

namespace cre {
namespace analytics {

CREApp::~CREApp() { closeLog(); }

int CREApp::run() {

    // Only one thread at a time should call run
    static std::mutex _s_mutex;
    std::lock_guard<std::mutex> lock(_s_mutex);

    QL_REQUIRE(params_, "CREApp: no parameters given");

    runTimer_.start();

    try {
        outputPath_ = params_->get("setup", "outputPath");
        string logFile = params_->get("setup", "logFile", false);
        string logMask = params_->get("setup", "logMask", false);
        setupLog(outputPath_, logFile.empty() ? "log.txt" : logFile,
                 logMask.empty() ? 31 : static_cast<QuantLib::Size>(parseInteger(logMask)));
        LOG("CRE starting, version " << CRE_VERSION);
        params_->log();

        analytics();
    } catch (const std::exception& e) {
        StructuredMessage(StructuredMessage::Category::Error, StructuredMessage::Group::Unknown, e.what(),
                          std::map<string, string>({{"exceptionType", "CREApp::run()"}}))
            .log();
        console(string("Error: ") + e.what());
        runTimer_.stop();
        return 1;
    }

    runTimer_.stop();
    console("run time: " + runTimer_.format(default_places, "%w") + " sec");
    console("CRE done.");
    LOG("CRE done.");
    return 0;
}

void CREApp::analytics() {
    loadInputs();
    calibrateCurveGroups();

    if (params_->isActive("curves")) {
        CalibrationReportWriter writer;
        string prefix = params_->get("curves", "outputFilePrefix", false);
        for (auto const& name : groupOrder_) {
            auto it = calibratedGroups_.find(name);
            if (it == calibratedGroups_.end())
                continue;
            auto curveReport = QuantLib::ext::make_shared<InMemoryReport>();
            writer.writeCurves(*curveReport, *it->second);
            reports_["curves_" + name] = curveReport;
            writeReport("curves_" + name, prefix + "curves_" + name + ".csv");
            auto jacobianReport = QuantLib::ext::make_shared<InMemoryReport>();
            writer.writeJacobian(*jacobianReport, *it->second);
            reports_["jacobian_" + name] = jacobianReport;
            writeReport("jacobian_" + name, prefix + "jacobian_" + name + ".csv");
        }
    }

    if (params_->isActive("npv"))
        runNpv();

    if (params_->isActive("sensitivity"))
        runSensitivity();

    if (params_->isActive("scenario"))
        runScenarios();

    QL_REQUIRE(failures_.empty(), failures_.size() << " curve groups failed to calibrate, first failure: "
                                                   << failures_.front());
}

void CREApp::loadInputs() {
    boost::filesystem::path inputPath = params_->get("setup", "inputPath");
    asof_ = parseDate(params_->get("setup", "asofDate"));
    LOG("Valuation date " << QuantLib::io::iso_date(asof_));

    conventions_ = QuantLib::ext::make_shared<Conventions>();
    boost::filesystem::path conventionsFile = inputPath / params_->get("setup", "conventionsFile");
    LOG("Loading conventions from file: " << conventionsFile);
    conventions_->fromFile(conventionsFile.generic_string());

    boost::filesystem::path curveGroupsFile = inputPath / params_->get("setup", "curveGroupsFile");
    LOG("Loading curve groups from file: " << curveGroupsFile);
    curveGroups_.fromFile(curveGroupsFile.generic_string());

    string tmp = params_->get("setup", "calibrationConfigFile", false);
    if (tmp != "") {
        boost::filesystem::path calibrationFile = inputPath / tmp;
        LOG("Loading calibration configuration from file: " << calibrationFile);
        calibrationConfig_.fromFile(calibrationFile.generic_string());
    } else {
        WLOG("Calibration configuration not found, using defaults");
    }

    std::vector<string> marketFiles;
    for (auto const& f : parseListOfValues(params_->get("setup", "marketDataFile")))
        marketFiles.push_back((inputPath / f).generic_string());
    loader_ = QuantLib::ext::make_shared<CSVLoader>(marketFiles);

    tmp = params_->get("setup", "portfolioFile", false);
    portfolio_.clear();
    if (tmp != "") {
        boost::filesystem::path portfolioFile = inputPath / tmp;
        LOG("Loading portfolio from file: " << portfolioFile);
        portfolio_.fromFile(portfolioFile.generic_string());
    } else {
        WLOG("Portfolio file not given, no trades are priced");
    }

    calibrator_ = QuantLib::ext::make_shared<CurveCalibrator>(conventions_, calibrationConfig_);

    groupOrder_.clear();
    if (params_->hasGroup("markets") && params_->has("markets", "curveGroups"))
        groupOrder_ = parseListOfValues(params_->get("markets", "curveGroups"));
    else
        groupOrder_ = curveGroups_.names();
    for (auto const& g : groupOrder_)
        QL_REQUIRE(curveGroups_.has(g), "curve group " << g << " not found in " << curveGroupsFile);
}

void CREApp::calibrateCurveGroups() {
    console("Calibrate curve groups ... ");
    MarketQuotes quotes = loader_->loadQuotes(asof_);
    QL_REQUIRE(!quotes.empty(), "no market quotes found for " << QuantLib::io::iso_date(asof_));

    calibratedGroups_.clear();
    failures_.clear();
    RatesCurveProvider seeds;
    for (auto const& name : groupOrder_) {
        CalibrationOutcome outcome = calibrator_->tryCalibrate(curveGroups_.get(name), quotes, seeds);
        if (succeeded(outcome)) {
            auto group = calibratedGroup(outcome);
            calibratedGroups_[name] = group;
            seeds = group->curves();
            console("  " + name + " calibrated");
        } else {
            // later groups are calibrated against the curves of the groups calibrated so far
            failures_.push_back(*failure(outcome));
            console("  " + name + " failed: " + failures_.back().message);
        }
    }
}

RatesCurveProvider CREApp::curves() const {
    for (auto it = groupOrder_.rbegin(); it != groupOrder_.rend(); ++it) {
        auto g = calibratedGroups_.find(*it);
        if (g != calibratedGroups_.end())
            return g->second->curves();
    }
    QL_FAIL("no curve group calibrated");
}

QuantLib::ext::shared_ptr<const CalibratedCurveGroup> CREApp::groupForTrade(const Trade& trade) const {
    auto instrument = trade.calibrationInstrument();
    for (auto const& name : groupOrder_) {
        auto g = calibratedGroups_.find(name);
        if (g == calibratedGroups_.end())
            continue;
        const RatesCurveProvider& provider = g->second->curves();
        bool covered = true;
        for (auto const& c : instrument->discountCurrencies())
            covered = covered && provider.discountCurveName(c);
        for (auto const& i : instrument->indices())
            covered = covered && provider.indexCurveName(i);
        if (covered)
            return g->second;
    }
    QL_FAIL("no calibrated curve group provides the curves for trade " << trade.id());
}

void CREApp::runNpv() {
    console("Price portfolio ... ");
    portfolio_.build(calibrator_->builder(), asof_);
    RatesCurveProvider provider = curves();

    auto report = QuantLib::ext::make_shared<InMemoryReport>();
    report->addColumn("TradeId", string())
        .addColumn("TradeType", string())
        .addColumn("Maturity", Date())
        .addColumn("MaturityTime", double(), 6)
        .addColumn("NPV", double(), 6)
        .addColumn("NpvCurrency", string())
        .addColumn("Notional", double(), 2);
    for (auto const& t : portfolio_.trades()) {
        try {
            InstrumentValue v = t.second->presentValue(provider);
            Date maturity = t.second->maturity();
            report->next()
                .add(t.first)
                .add(t.second->tradeType())
                .add(maturity)
                .add(QuantLib::Actual365Fixed().yearFraction(asof_, maturity))
                .add(v.value)
                .add(t.second->currency())
                .add(t.second->notional());
        } catch (const std::exception& e) {
            StructuredMessage(StructuredMessage::Category::Error, StructuredMessage::Group::Trade, e.what(),
                              std::map<string, string>({{"tradeId", t.first}, {"exceptionType", "Trade Pricing"}}))
                .log();
        }
    }
    report->end();
    reports_["npv"] = report;
    string fileName = params_->get("npv", "outputFileName", false);
    writeReport("npv", fileName.empty() ? "npv.csv" : fileName);
}

void CREApp::runSensitivity() {
    console("Market quote sensitivities ... ");
    portfolio_.build(calibrator_->builder(), asof_);

    auto report = QuantLib::ext::make_shared<InMemoryReport>();
    report->addColumn("TradeId", string())
        .addColumn("CurveGroup", string())
        .addColumn("QuoteId", string())
        .addColumn("Currency", string())
        .addColumn("Sensitivity", double(), 6);
    auto seedReport = QuantLib::ext::make_shared<InMemoryReport>();
    seedReport->addColumn("TradeId", string())
        .addColumn("CurveId", string())
        .addColumn("Currency", string())
        .addColumn("Node", string())
        .addColumn("Date", Date())
        .addColumn("Sensitivity", double(), 6);

    for (auto const& t : portfolio_.trades()) {
        try {
            auto group = groupForTrade(*t.second);
            SensitivityPropagator propagator(group);
            CurrencyParameterSensitivities parameters =
                propagator.parameterSensitivity(t.second->presentValue(group->curves()).sensitivities);
            for (auto const& q : propagator.toMarketQuoteSensitivity(parameters).data())
                report->next().add(t.first).add(group->name()).add(q.first.first).add(q.first.second).add(q.second);
            for (auto const& s : propagator.seedSensitivities(parameters).sensitivities()) {
                for (Size i = 0; i < s.sensitivity.size(); ++i)
                    seedReport->next()
                        .add(t.first)
                        .add(s.curveName)
                        .add(s.currency)
                        .add(s.metadata[i].label)
                        .add(s.metadata[i].date)
                        .add(s.sensitivity[i]);
            }
        } catch (const std::exception& e) {
            StructuredMessage(StructuredMessage::Category::Error, StructuredMessage::Group::Trade, e.what(),
                              std::map<string, string>({{"tradeId", t.first}, {"exceptionType", "Sensitivity"}}))
                .log();
        }
    }
    report->end();
    seedReport->end();
    reports_["sensitivity"] = report;
    reports_["seed_sensitivity"] = seedReport;

    string fileName = params_->get("sensitivity", "outputFileName", false);
    writeReport("sensitivity", fileName.empty() ? "sensitivity.csv" : fileName);
    fileName = params_->get("sensitivity", "seedOutputFileName", false);
    writeReport("seed_sensitivity", fileName.empty() ? "seed_sensitivity.csv" : fileName);
}

void CREApp::runScenarios() {
    string groupName = params_->get("scenario", "curveGroup", false);
    if (groupName.empty()) {
        QL_REQUIRE(!groupOrder_.empty(), "no curve group for scenario calibration");
        groupName = groupOrder_.front();
    }
    QL_REQUIRE(curveGroups_.has(groupName), "scenario curve group " << groupName << " not found");
    string tmp = params_->get("setup", "nThreads", false);
    Size nThreads = tmp.empty() ? 1 : static_cast<Size>(parseInteger(tmp));

    std::vector<MarketQuotes> scenarios;
    for (auto const& d : loader_->dates()) {
        DLOG("Scenario " << scenarios.size() << " is the market of " << QuantLib::io::iso_date(d));
        scenarios.push_back(loader_->loadQuotes(d));
    }
    console("Calibrate " + std::to_string(scenarios.size()) + " market scenarios ... ");

    ScenarioCalibrationEngine engine(calibrator_, nThreads);
    std::vector<CalibrationOutcome> outcomes = engine.run(curveGroups_.get(groupName), scenarios);

    auto report = QuantLib::ext::make_shared<InMemoryReport>();
    CalibrationReportWriter().writeScenarioOutcomes(*report, outcomes);
    reports_["scenario"] = report;
    string fileName = params_->get("scenario", "outputFileName", false);
    writeReport("scenario", fileName.empty() ? "scenario.csv" : fileName);
}

void CREApp::writeReport(const string& name, const string& fileName) {
    auto report = getReport(name);
    boost::filesystem::path p = boost::filesystem::path(outputPath_) / fileName;
    LOG("Write report " << name << " to " << p);
    report->toFile(p.generic_string());
}

std::set<string> CREApp::getReportNames() const {
    std::set<string> names;
    for (auto const& r : reports_)
        names.insert(r.first);
    return names;
}

QuantLib::ext::shared_ptr<InMemoryReport> CREApp::getReport(const string& reportName) const {
    auto it = reports_.find(reportName);
    QL_REQUIRE(it != reports_.end(), "report " << reportName << " not found");
    return it->second;
}

Real CREApp::getRunTime() const {
    using namespace boost::timer;
    nanosecond_type t = runTimer_.elapsed().wall;
    return static_cast<Real>(t) / 1.0E9;
}

void CREApp::setupLog(const string& path, const string& file, QuantLib::Size mask) {
    closeLog();

    boost::filesystem::path p{path};
    if (!boost::filesystem::exists(p)) {
        boost::filesystem::create_directories(p);
    }
    QL_REQUIRE(boost::filesystem::is_directory(p), "output path '" << path << "' is not a directory.");

    Log::instance().registerLogger(QuantLib::ext::make_shared<FileLogger>((p / file).generic_string()));
    Log::instance().setMask(static_cast<unsigned>(mask));
    Log::instance().switchOn();
}

void CREApp::closeLog() { Log::instance().removeAllLoggers(); }

void CREApp::console(const string& text) const {
    if (console_)
        std::cout << text << std::endl;
}

} // namespace analytics
} // namespace cre

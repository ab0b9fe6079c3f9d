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

/*! \file crea/engine/scenariocalibrationengine.hpp
    \brief Calibration of a curve group under a batch of market scenarios
    \ingroup engine
*/

#pragma once

#include <crea/engine/calibrationoutcome.hpp>
#include <crea/engine/curvecalibrator.hpp>

#include <cred/configuration/curvedefinition.hpp>
#include <cred/marketdata/marketquotes.hpp>

#include <cve/termstructures/ratescurveprovider.hpp>

#include <ql/shared_ptr.hpp>

#include <atomic>
#include <vector>

namespace cre {
namespace analytics {

//! Calibrates one curve group independently for each scenario of a batch
/*! The scenarios are distributed over a pool of worker threads which pull scenario indices from
    a shared counter. Each scenario owns its quotes and yields its own immutable outcome, a failed
    scenario does not affect the others. The outcomes are returned in scenario order.

    Cancellation is scenario granular: once cancel() is called, scenarios that have not started
    yet are not calibrated and report a failure of kind Cancelled, scenarios already running are
    completed. The flag stays set until reset() is called.

    \ingroup engine
*/
class ScenarioCalibrationEngine {
public:
    ScenarioCalibrationEngine(const QuantLib::ext::shared_ptr<const CurveCalibrator>& calibrator,
                              Size nThreads = 1);

    //! calibrates all scenarios against the same seed curves
    std::vector<CalibrationOutcome>
    run(const data::CurveGroupDefinition& group, const std::vector<data::MarketQuotes>& scenarios,
        const CurveExt::RatesCurveProvider& seeds = CurveExt::RatesCurveProvider()) const;

    //! calibrates scenario i against seeds[i]
    std::vector<CalibrationOutcome> run(const data::CurveGroupDefinition& group,
                                        const std::vector<data::MarketQuotes>& scenarios,
                                        const std::vector<CurveExt::RatesCurveProvider>& seeds) const;

    void cancel() { cancelled_ = true; }
    void reset() { cancelled_ = false; }
    bool cancelled() const { return cancelled_; }

    Size nThreads() const { return nThreads_; }
    const QuantLib::ext::shared_ptr<const CurveCalibrator>& calibrator() const { return calibrator_; }

private:
    QuantLib::ext::shared_ptr<const CurveCalibrator> calibrator_;
    Size nThreads_;
    std::atomic<bool> cancelled_;
};

} // namespace analytics
} // namespace cre

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

#include <crea/engine/scenariocalibrationengine.hpp>

#include <cred/utilities/log.hpp>

#include <ql/errors.hpp>

#include <boost/timer/timer.hpp>

#include <algorithm>
#include <future>
#include <map>
#include <thread>

using namespace CurveExt;
using std::string;

namespace cre {
namespace analytics {

ScenarioCalibrationEngine::ScenarioCalibrationEngine(const QuantLib::ext::shared_ptr<const CurveCalibrator>& calibrator,
                                                     Size nThreads)
    : calibrator_(calibrator), nThreads_(nThreads), cancelled_(false) {
    QL_REQUIRE(calibrator_, "ScenarioCalibrationEngine: no calibrator given");
    QL_REQUIRE(nThreads_ > 0, "ScenarioCalibrationEngine: number of threads must be positive");
}

std::vector<CalibrationOutcome> ScenarioCalibrationEngine::run(const data::CurveGroupDefinition& group,
                                                               const std::vector<data::MarketQuotes>& scenarios,
                                                               const RatesCurveProvider& seeds) const {
    return run(group, scenarios, std::vector<RatesCurveProvider>(scenarios.size(), seeds));
}

std::vector<CalibrationOutcome> ScenarioCalibrationEngine::run(const data::CurveGroupDefinition& group,
                                                               const std::vector<data::MarketQuotes>& scenarios,
                                                               const std::vector<RatesCurveProvider>& seeds) const {

    QL_REQUIRE(seeds.size() == scenarios.size(), "ScenarioCalibrationEngine: " << seeds.size()
                                                                               << " seed providers for "
                                                                               << scenarios.size() << " scenarios");

    boost::timer::cpu_timer timer;

    Size nScenarios = scenarios.size();
    Size eff_nThreads = std::max<Size>(1, std::min(nThreads_, nScenarios));

    LOG("ScenarioCalibrationEngine: calibrate group " << group.name() << " for " << nScenarios << " scenarios on "
                                                      << eff_nThreads << " threads");

    // every slot is written by exactly one worker

    std::vector<CalibrationOutcome> outcomes(nScenarios);
    std::atomic<Size> next(0);

    using resultType = Size;
    std::vector<std::future<resultType>> results(eff_nThreads);
    std::vector<std::thread> jobs;

    for (Size i = 0; i < eff_nThreads; ++i) {

        auto job = [this, &group, &scenarios, &seeds, &outcomes, &next, nScenarios](Size id) -> resultType {
            DLOG("ScenarioCalibrationEngine: start thread " << id);
            Size calibrated = 0;
            for (Size s = next++; s < nScenarios; s = next++) {
                if (cancelled_) {
                    CalibrationFailure f(CalibrationError::Kind::Cancelled, group.name(),
                                         "scenario " + std::to_string(s) + " cancelled before calibration");
                    data::StructuredMessage(data::StructuredMessage::Category::Warning,
                                            data::StructuredMessage::Group::Scenario, f.message,
                                            std::map<string, string>({{"curveGroup", group.name()}}))
                        .log();
                    outcomes[s] = f;
                    continue;
                }
                DLOG("ScenarioCalibrationEngine: thread " << id << " calibrates scenario " << s);
                outcomes[s] = calibrator_->tryCalibrate(group, scenarios[s], seeds[s]);
                ++calibrated;
            }
            DLOG("ScenarioCalibrationEngine: thread " << id << " finished, " << calibrated
                                                      << " scenarios calibrated");
            return calibrated;
        };

        std::packaged_task<resultType(Size)> task(job);
        results[i] = task.get_future();
        std::thread thread(std::move(task), i);
        jobs.emplace_back(std::move(thread));
    }

    for (auto& t : jobs)
        t.join();

    Size calibrated = 0;
    for (Size i = 0; i < results.size(); ++i) {
        QL_REQUIRE(results[i].valid(), "internal error: did not get a valid result from thread " << i);
        calibrated += results[i].get();
    }

    Size failed = 0;
    for (auto const& o : outcomes) {
        if (!succeeded(o))
            ++failed;
    }

    LOG("ScenarioCalibrationEngine: " << calibrated << " of " << nScenarios << " scenarios calibrated, " << failed
                                      << " failed or cancelled, timings: "
                                      << static_cast<double>(timer.elapsed().wall) / 1.0E9 << "s Wall");

    return outcomes;
}

} // namespace analytics
} // namespace cre

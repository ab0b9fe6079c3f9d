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

#include <crea/engine/curvecalibrator.hpp>
#include <crea/engine/curvedependencygraph.hpp>
#include <crea/engine/residualjacobianassembler.hpp>

#include <cred/marketdata/structuredcurveerror.hpp>
#include <cred/utilities/log.hpp>
#include <cred/utilities/to_string.hpp>

#include <cve/math/newtonsolver.hpp>
#include <cve/utilities/calibrationerror.hpp>

#include <sstream>

using namespace cre::data;
using namespace CurveExt;
using QuantLib::Date;
using std::map;
using std::string;
using std::vector;

namespace cre {
namespace analytics {

namespace {

// instruments and initial curve of one curve of the group
struct CurveSetup {
    vector<QuantLib::ext::shared_ptr<const CalibrationInstrument>> instruments;
    vector<string> quoteIds;
    CurveRequirements requirements;
    vector<Date> dates;
    vector<ParameterMetadata> metadata;
    Array guess;
};

void checkNodeDates(const CurveDefinition& def, const vector<Date>& dates, const Date& asof) {
    for (Size i = 0; i < dates.size(); ++i) {
        if (dates[i] <= asof) {
            std::ostringstream msg;
            msg << "curve " << def.name() << ": node " << def.nodes()[i].quoteId() << " has node date "
                << to_string(dates[i]) << " which is not after the valuation date " << to_string(asof);
            throw InvalidCurveNodeError(msg.str());
        }
        if (i > 0 && dates[i] <= dates[i - 1]) {
            std::ostringstream msg;
            msg << "curve " << def.name() << ": node dates must be strictly increasing, node "
                << def.nodes()[i].quoteId() << " has date " << to_string(dates[i]) << " and node "
                << def.nodes()[i - 1].quoteId() << " has date " << to_string(dates[i - 1]);
            throw InvalidCurveNodeError(msg.str());
        }
    }
}

// curves of the provider with the parameters x, the curves are given in the order of x
vector<InterpolatedParameterCurve> curvesWithParameters(const RatesCurveProvider& provider,
                                                        const vector<string>& names, const Array& x) {
    vector<InterpolatedParameterCurve> result;
    Size offset = 0;
    for (auto const& n : names) {
        const InterpolatedParameterCurve& c = provider.curve(n);
        Array p(x.begin() + offset, x.begin() + offset + c.parameterCount());
        result.push_back(c.withParameters(p));
        offset += c.parameterCount();
    }
    return result;
}

} // namespace

CurveCalibrator::CurveCalibrator(const QuantLib::ext::shared_ptr<Conventions>& conventions,
                                 const CalibrationConfig& config)
    : builder_(conventions), config_(config) {}

QuantLib::ext::shared_ptr<const CalibratedCurveGroup>
CurveCalibrator::calibrate(const CurveGroupDefinition& group, const MarketQuotes& quotes,
                           const RatesCurveProvider& seeds) const {

    const Date& asof = quotes.asof();
    QL_REQUIRE(asof != Date(), "CurveCalibrator: market quotes without as of date for curve group " << group.name());
    QL_REQUIRE(seeds.curveNames().empty() || seeds.valuationDate() == asof,
               "CurveCalibrator: seed curves valuation date " << to_string(seeds.valuationDate())
                                                              << " does not match the quotes date " << to_string(asof));

    LOG("Calibrating curve group " << group.name() << " for " << to_string(asof) << " with "
                                   << group.parameterCount() << " parameters");

    // build the instruments

    map<string, CurveSetup> setups;
    map<string, CurveRequirements> requirements;
    for (auto const& def : group.curveDefinitions()) {
        CurveSetup& setup = setups[def.name()];
        setup.guess = Array(def.nodes().size());
        for (Size i = 0; i < def.nodes().size(); ++i) {
            const CurveNode& node = def.nodes()[i];
            BuiltInstrument b = builder_.build(node, asof, quotes, def.valueType());
            setup.instruments.push_back(b.instrument);
            setup.quoteIds.push_back(node.quoteId());
            for (auto const& ccy : b.instrument->discountCurrencies())
                setup.requirements.discountCurrencies.insert(ccy);
            for (auto const& index : b.instrument->indices())
                setup.requirements.indices.insert(index);
            setup.dates.push_back(b.nodeDate);
            setup.metadata.push_back(b.metadata);
            setup.guess[i] = b.initialGuess;
        }
        checkNodeDates(def, setup.dates, asof);
        requirements[def.name()] = setup.requirements;
        DLOG("Built " << setup.instruments.size() << " calibration instruments for curve " << def.name());
    }

    // calibration order, this also checks the group curves against the seed curves

    CurveDependencyGraph graph(group, requirements, seeds);

    // initial curves

    RatesCurveProvider provider = seeds.curveNames().empty() ? RatesCurveProvider(asof) : seeds;
    for (auto const& def : group.curveDefinitions()) {
        const CurveSetup& setup = setups.at(def.name());
        CurveGroupEntry entry = group.entry(def.name());
        provider.addCurve(InterpolatedParameterCurve(def.name(), def.currency(), asof, def.dayCounter(),
                                                     def.valueType(), def.interpolator(), def.leftExtrapolator(),
                                                     def.rightExtrapolator(), setup.dates, setup.guess,
                                                     setup.metadata),
                          entry.discountCurrencies, entry.indices);
    }

    // solve layer by layer

    vector<Size> iterations;
    for (Size l = 0; l < graph.layers().size(); ++l) {
        const vector<string>& layer = graph.layers()[l];
        vector<QuantLib::ext::shared_ptr<const CalibrationInstrument>> instruments;
        vector<Size> counts;
        for (auto const& c : layer) {
            const CurveSetup& setup = setups.at(c);
            instruments.insert(instruments.end(), setup.instruments.begin(), setup.instruments.end());
            counts.push_back(provider.curve(c).parameterCount());
        }
        ResidualJacobianAssembler assembler(instruments, layer, counts, config_.measure());

        Array x(assembler.columns());
        for (auto const& c : layer) {
            const Array& p = provider.curve(c).parameters();
            std::copy(p.begin(), p.end(), x.begin() + assembler.offset(c));
        }

        const RatesCurveProvider& frozen = provider;
        NewtonSolver::System system = [&frozen, &layer, &assembler](const Array& params, Array& r, Matrix& j) {
            assembler.assemble(frozen.withCurves(curvesWithParameters(frozen, layer, params)), r, j);
        };

        NewtonSolver solver(config_.tolerance(), config_.maxIterations(), config_.maxConditionNumber(),
                            config_.maxStepHalvings());
        solver.solveOrThrow(system, x);
        provider = provider.withCurves(curvesWithParameters(provider, layer, x));
        iterations.push_back(solver.iterations());
        DLOG("Layer #" << l << " of curve group " << group.name() << " converged after " << solver.iterations()
                       << " iterations, max residual " << solver.residualNorm());
    }

    // Jacobian of the whole group at the solution

    vector<string> curveNames;
    vector<Size> counts;
    vector<string> quoteIds;
    vector<QuantLib::ext::shared_ptr<const CalibrationInstrument>> instruments;
    for (auto const& def : group.curveDefinitions()) {
        const CurveSetup& setup = setups.at(def.name());
        curveNames.push_back(def.name());
        counts.push_back(def.parameterCount());
        instruments.insert(instruments.end(), setup.instruments.begin(), setup.instruments.end());
        quoteIds.insert(quoteIds.end(), setup.quoteIds.begin(), setup.quoteIds.end());
    }
    ResidualJacobianAssembler assembler(instruments, curveNames, counts, config_.measure());
    Array residuals;
    Matrix jacobian;
    assembler.assemble(provider, residuals, jacobian);
    Array quoteDerivatives = assembler.quoteDerivatives(provider);

    LOG("Curve group " << group.name() << " calibrated, max residual " << maxAbsolute(residuals));
    return QuantLib::ext::make_shared<CalibratedCurveGroup>(group.name(), provider, curveNames, graph.layers(),
                                                            quoteIds, instruments, config_.measure(), jacobian,
                                                            quoteDerivatives, iterations);
}

CalibrationOutcome CurveCalibrator::tryCalibrate(const CurveGroupDefinition& group, const MarketQuotes& quotes,
                                                 const RatesCurveProvider& seeds) const {
    CalibrationFailure f;
    try {
        return calibrate(group, quotes, seeds);
    } catch (const MissingMarketDataError& e) {
        f = CalibrationFailure(e.kind(), group.name(), e.what(), e.quoteId());
    } catch (const CalibrationError& e) {
        f = CalibrationFailure(e.kind(), group.name(), e.what());
    } catch (const std::exception& e) {
        f = CalibrationFailure(CalibrationError::Kind::Other, group.name(), e.what());
    }
    StructuredCurveErrorMessage(group.name(), to_string(f.kind), f.message).log();
    return f;
}

} // namespace analytics
} // namespace cre

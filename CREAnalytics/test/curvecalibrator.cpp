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

#include <boost/test/unit_test.hpp>
#include <cret/toplevelfixture.hpp>
#include <test/testmarket.hpp>

#include <crea/engine/curvecalibrator.hpp>

#include <cve/utilities/calibrationerror.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

using namespace std;
using namespace boost::unit_test_framework;
using namespace QuantLib;
using namespace cre::data;
using namespace cre::analytics;
using namespace CurveExt;
using testsuite::TestMarket;

namespace {

// maximum residual of the calibration instruments on the calibrated curves
Real maxResidual(const CalibratedCurveGroup& g) {
    Real m = 0.0;
    for (auto const& i : g.instruments())
        m = std::max(m, std::fabs(i->measure(g.measure(), g.curves()).value));
    return m;
}

// parameters of the calibrated curves of the group in Jacobian column order
Array groupParameters(const CalibratedCurveGroup& g) {
    Array x(g.parameterCount());
    for (auto const& c : g.calibratedCurves()) {
        const Array& p = g.curve(c).parameters();
        std::copy(p.begin(), p.end(), x.begin() + g.parameterOffset(c));
    }
    return x;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(CREAnalyticsTestSuite, cre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(CurveCalibratorTests)

BOOST_FIXTURE_TEST_CASE(testTwoNodeCurve, TestMarket) {

    BOOST_TEST_MESSAGE("Testing calibration of a two node curve...");

    auto g = calibrator->calibrate(group("EUR-TWO-NODE"), market);

    BOOST_CHECK_EQUAL(g->name(), "EUR-TWO-NODE");
    BOOST_CHECK_EQUAL(g->valuationDate(), asof);
    BOOST_REQUIRE_EQUAL(g->layers().size(), 1);
    BOOST_REQUIRE_EQUAL(g->iterations().size(), 1);
    BOOST_CHECK(g->iterations()[0] <= 10);
    BOOST_CHECK_SMALL(maxResidual(*g), 1.0e-10);

    BOOST_CHECK_EQUAL(g->parameterCount(), 2);
    BOOST_CHECK_EQUAL(g->jacobian().rows(), 2);
    BOOST_CHECK_EQUAL(g->jacobian().columns(), 2);
    BOOST_REQUIRE_EQUAL(g->quoteIds().size(), 2);
    BOOST_CHECK_EQUAL(g->quoteIds()[0], "TEST/DEPOSIT/1D");
    BOOST_CHECK_EQUAL(g->quoteIds()[1], "TEST/OIS/1Y");

    // overnight deposit from 30 Jun to 1 Jul on A360, the log discount factor is exact
    const InterpolatedParameterCurve& c = g->curve("EUR-ESTR");
    BOOST_CHECK_EQUAL(c.nodeDates()[0], Date(1, July, 2026));
    BOOST_CHECK_CLOSE(c.parameters()[0], -std::log(1.0 + 0.001 / 360.0), 1.0e-8);
    BOOST_CHECK_CLOSE(c.discountFactor(Date(1, July, 2026)), 1.0 / (1.0 + 0.001 / 360.0), 1.0e-10);

    // the deposit does not depend on the one year node
    BOOST_CHECK_SMALL(g->jacobian()[0][1], 1.0e-14);
    BOOST_CHECK(std::fabs(g->jacobian()[1][1]) > 0.0);
}

BOOST_FIXTURE_TEST_CASE(testRepricing, TestMarket) {

    BOOST_TEST_MESSAGE("Testing that calibrated curves reprice their instruments...");

    for (auto const& name : {"EUR-OIS", "EUR-OIS-ZERO"}) {
        BOOST_TEST_MESSAGE("Curve group " << name);
        auto g = calibrator->calibrate(group(name), market);
        BOOST_CHECK_SMALL(maxResidual(*g), 1.0e-10);
        BOOST_CHECK_EQUAL(g->parameterCount(), 7);
        BOOST_CHECK_EQUAL(g->quoteIds().size(), 7);
        BOOST_CHECK(g->isCalibrated("EUR-ESTR"));
        BOOST_CHECK_EQUAL(g->measure(), CalibrationMeasure::ParSpread);

        // the present value measure gives the same curves
        CalibrationConfig pvConfig(1.0e-12, 100, 1.0e12, 10, CalibrationMeasure::PresentValue);
        auto pv = CurveCalibrator(conventions, pvConfig).calibrate(group(name), market);
        BOOST_CHECK_EQUAL(pv->measure(), CalibrationMeasure::PresentValue);
        const Array& p1 = g->curve("EUR-ESTR").parameters();
        const Array& p2 = pv->curve("EUR-ESTR").parameters();
        for (Size i = 0; i < p1.size(); ++i)
            BOOST_CHECK_SMALL(p1[i] - p2[i], 1.0e-9);

        // zero rates are close to the quotes
        const InterpolatedParameterCurve& c = g->curve("EUR-ESTR");
        for (Size i = 0; i < c.nodeDates().size(); ++i) {
            Real q = *market.get(g->quoteIds()[i]);
            BOOST_CHECK_SMALL(c.zeroRate(c.nodeDates()[i]) - q, 3.0e-3);
        }
    }
}

BOOST_FIXTURE_TEST_CASE(testJointGroup, TestMarket) {

    BOOST_TEST_MESSAGE("Testing calibration of a group with dependent curves...");

    auto g = calibrator->calibrate(group("EUR-JOINT"), market);

    // the forwarding curve is listed first but discounted on the OIS curve
    BOOST_REQUIRE_EQUAL(g->layers().size(), 2);
    BOOST_REQUIRE_EQUAL(g->layers()[0].size(), 1);
    BOOST_REQUIRE_EQUAL(g->layers()[1].size(), 1);
    BOOST_CHECK_EQUAL(g->layers()[0][0], "EUR-ESTR");
    BOOST_CHECK_EQUAL(g->layers()[1][0], "EUR-EURIBOR-6M");
    BOOST_REQUIRE_EQUAL(g->calibratedCurves().size(), 2);
    BOOST_CHECK_EQUAL(g->calibratedCurves()[0], "EUR-EURIBOR-6M");
    BOOST_CHECK_EQUAL(g->calibratedCurves()[1], "EUR-ESTR");
    BOOST_CHECK_EQUAL(g->parameterOffset("EUR-EURIBOR-6M"), 0);
    BOOST_CHECK_EQUAL(g->parameterOffset("EUR-ESTR"), 7);
    BOOST_CHECK_THROW(g->parameterOffset("EUR-EURIBOR-3M"), QuantLib::Error);
    BOOST_CHECK_EQUAL(g->parameterCount(), 14);
    BOOST_CHECK_SMALL(maxResidual(*g), 1.0e-10);

    // OIS instruments do not depend on the forwarding curve
    const Matrix& j = g->jacobian();
    for (Size r = 7; r < 14; ++r)
        for (Size c = 0; c < 7; ++c)
            BOOST_CHECK_EQUAL(j[r][c], 0.0);
    // the swaps of the forwarding curve are sensitive to the discount curve
    Real cross = 0.0;
    for (Size r = 2; r < 7; ++r)
        for (Size c = 7; c < 14; ++c)
            cross += std::fabs(j[r][c]);
    BOOST_CHECK(cross > 0.0);

    // same curves as the sequential calibration of the two groups
    auto ois = calibrator->calibrate(group("EUR-OIS"), market);
    auto ibor = calibrator->calibrate(group("EUR-6M"), market, ois->curves());
    for (auto const& c : {"EUR-ESTR", "EUR-EURIBOR-6M"}) {
        const Array& p = g->curve(c).parameters();
        const Array& q = (ois->isCalibrated(c) ? ois : ibor)->curve(c).parameters();
        BOOST_REQUIRE_EQUAL(p.size(), q.size());
        for (Size i = 0; i < p.size(); ++i)
            BOOST_CHECK_SMALL(p[i] - q[i], 1.0e-12);
    }
}

BOOST_FIXTURE_TEST_CASE(testSeedCurves, TestMarket) {

    BOOST_TEST_MESSAGE("Testing calibration against seed curves...");

    auto ois = calibrator->calibrate(group("EUR-OIS"), market);
    auto g = calibrator->calibrate(group("EUR-6M"), market, ois->curves());

    BOOST_CHECK(g->isCalibrated("EUR-EURIBOR-6M"));
    BOOST_CHECK(!g->isCalibrated("EUR-ESTR"));
    BOOST_CHECK(g->curves().hasCurve("EUR-ESTR"));
    BOOST_CHECK_EQUAL(*g->curves().discountCurveName("EUR"), "EUR-ESTR");
    BOOST_CHECK_EQUAL(g->parameterCount(), 7);
    BOOST_CHECK_EQUAL(g->calibratedCurves().size(), 1);
    BOOST_CHECK_SMALL(maxResidual(*g), 1.0e-10);

    // the seed curve is not changed
    const Array& seed = ois->curve("EUR-ESTR").parameters();
    const Array& used = g->curve("EUR-ESTR").parameters();
    BOOST_REQUIRE_EQUAL(seed.size(), used.size());
    for (Size i = 0; i < seed.size(); ++i)
        BOOST_CHECK_EQUAL(seed[i], used[i]);

    // the discount factors of the forwarding curve are below one and decreasing
    const InterpolatedParameterCurve& c = g->curve("EUR-EURIBOR-6M");
    Real previous = 1.0;
    for (auto const& d : c.nodeDates()) {
        Real df = c.discountFactor(d);
        BOOST_CHECK(df < previous);
        previous = df;
    }
}

BOOST_FIXTURE_TEST_CASE(testMissingSeedCurve, TestMarket) {

    BOOST_TEST_MESSAGE("Testing calibration without a required seed curve...");

    BOOST_CHECK_THROW(calibrator->calibrate(group("EUR-6M"), market), InvalidCurveNodeError);

    CalibrationOutcome outcome = calibrator->tryCalibrate(group("EUR-6M"), market);
    BOOST_CHECK(!succeeded(outcome));
    BOOST_CHECK_THROW(calibratedGroup(outcome), QuantLib::Error);
    BOOST_REQUIRE(failure(outcome));
    BOOST_CHECK_EQUAL(failure(outcome)->kind, CalibrationError::Kind::InvalidCurveNode);
    BOOST_CHECK_EQUAL(failure(outcome)->groupName, "EUR-6M");
    BOOST_CHECK(failure(outcome)->quoteId.empty());
}

BOOST_FIXTURE_TEST_CASE(testMissingQuote, TestMarket) {

    BOOST_TEST_MESSAGE("Testing calibration with a missing market quote...");

    MarketQuotes quotes = loader->loadQuotes(Date(2, July, 2026));
    BOOST_REQUIRE(!quotes.has("IR_SWAP/RATE/EUR/2D/1D/5Y"));

    try {
        calibrator->calibrate(group("EUR-OIS"), quotes);
        BOOST_FAIL("calibration with a missing quote should fail");
    } catch (const MissingMarketDataError& e) {
        BOOST_CHECK_EQUAL(e.quoteId(), "IR_SWAP/RATE/EUR/2D/1D/5Y");
        BOOST_CHECK_EQUAL(e.kind(), CalibrationError::Kind::MissingMarketData);
    }

    CalibrationOutcome outcome = calibrator->tryCalibrate(group("EUR-OIS"), quotes);
    BOOST_REQUIRE(failure(outcome));
    BOOST_CHECK_EQUAL(failure(outcome)->kind, CalibrationError::Kind::MissingMarketData);
    BOOST_CHECK_EQUAL(failure(outcome)->quoteId, "IR_SWAP/RATE/EUR/2D/1D/5Y");
    BOOST_CHECK_EQUAL(failure(outcome)->groupName, "EUR-OIS");

    // the other scenario dates are complete
    BOOST_CHECK(succeeded(calibrator->tryCalibrate(group("EUR-OIS"), loader->loadQuotes(Date(1, July, 2026)))));
}

BOOST_FIXTURE_TEST_CASE(testMaxIterations, TestMarket) {

    BOOST_TEST_MESSAGE("Testing calibration that exceeds the maximum number of iterations...");

    CurveCalibrator oneStep(conventions, CalibrationConfig(1.0e-12, 1));
    BOOST_CHECK_THROW(oneStep.calibrate(group("EUR-OIS"), market), MaxIterationsExceededError);

    CalibrationOutcome outcome = oneStep.tryCalibrate(group("EUR-OIS"), market);
    BOOST_REQUIRE(failure(outcome));
    BOOST_CHECK_EQUAL(failure(outcome)->kind, CalibrationError::Kind::MaxIterationsExceeded);
}

BOOST_FIXTURE_TEST_CASE(testCyclicDependency, TestMarket) {

    BOOST_TEST_MESSAGE("Testing calibration of curves that depend on each other...");

    BOOST_CHECK_THROW(calibrator->calibrate(group("EUR-CYCLIC"), market), CyclicCurveDependencyError);

    CalibrationOutcome outcome = calibrator->tryCalibrate(group("EUR-CYCLIC"), market);
    BOOST_REQUIRE(failure(outcome));
    BOOST_CHECK_EQUAL(failure(outcome)->kind, CalibrationError::Kind::CyclicCurveDependency);
    BOOST_CHECK_EQUAL(failure(outcome)->groupName, "EUR-CYCLIC");
}

BOOST_FIXTURE_TEST_CASE(testSeedDateMismatch, TestMarket) {

    BOOST_TEST_MESSAGE("Testing seed curves of another valuation date...");

    auto ois = calibrator->calibrate(group("EUR-OIS"), market);
    MarketQuotes next = loader->loadQuotes(Date(1, July, 2026));
    BOOST_CHECK_THROW(calibrator->calibrate(group("EUR-6M"), next, ois->curves()), QuantLib::Error);

    CalibrationOutcome outcome = calibrator->tryCalibrate(group("EUR-6M"), next, ois->curves());
    BOOST_REQUIRE(failure(outcome));
    BOOST_CHECK_EQUAL(failure(outcome)->kind, CalibrationError::Kind::Other);
}

BOOST_FIXTURE_TEST_CASE(testDeterminism, TestMarket) {

    BOOST_TEST_MESSAGE("Testing that repeated calibrations give identical results...");

    auto g1 = calibrator->calibrate(group("EUR-JOINT"), market);
    auto g2 = calibrator->calibrate(group("EUR-JOINT"), market);

    Array x1 = groupParameters(*g1), x2 = groupParameters(*g2);
    for (Size i = 0; i < x1.size(); ++i)
        BOOST_CHECK_EQUAL(x1[i], x2[i]);
    for (Size r = 0; r < g1->jacobian().rows(); ++r)
        for (Size c = 0; c < g1->jacobian().columns(); ++c)
            BOOST_CHECK_EQUAL(g1->jacobian()[r][c], g2->jacobian()[r][c]);
    BOOST_CHECK(g1->iterations() == g2->iterations());
}

BOOST_FIXTURE_TEST_CASE(testParameterQuoteDerivatives, TestMarket) {

    BOOST_TEST_MESSAGE("Testing parameter quote derivatives against bumped calibrations...");

    auto g = calibrator->calibrate(group("EUR-JOINT"), market);
    const Matrix& d = g->parameterQuoteDerivatives();
    BOOST_REQUIRE_EQUAL(d.rows(), g->parameterCount());
    BOOST_REQUIRE_EQUAL(d.columns(), g->quoteIds().size());

    const Real h = 1.0e-5;
    for (Size k = 0; k < g->quoteIds().size(); ++k) {
        const string& id = g->quoteIds()[k];
        Array up = groupParameters(*calibrator->calibrate(group("EUR-JOINT"), market.withBump(id, h)));
        Array down = groupParameters(*calibrator->calibrate(group("EUR-JOINT"), market.withBump(id, -h)));
        for (Size i = 0; i < g->parameterCount(); ++i) {
            Real fd = (up[i] - down[i]) / (2.0 * h);
            BOOST_CHECK_MESSAGE(std::fabs(fd - d[i][k]) < 1.0e-5, "parameter " << i << " quote " << id
                                                                                << ": bumped " << fd
                                                                                << ", analytic " << d[i][k]);
        }
    }
}

BOOST_FIXTURE_TEST_CASE(testParameterQuoteDerivativeConvergence, TestMarket) {

    BOOST_TEST_MESSAGE("Testing convergence of one sided bumps to the parameter quote derivatives...");

    CurveCalibrator tight(conventions, CalibrationConfig(1.0e-14));
    auto g = tight.calibrate(group("EUR-JOINT"), market);
    const Matrix& d = g->parameterQuoteDerivatives();
    Array base = groupParameters(*g);

    // the truncation error of a forward difference is linear in the bump size
    vector<Real> errors;
    for (Real h : {1.0e-4, 1.0e-5, 1.0e-6}) {
        Real error = 0.0;
        for (Size k = 0; k < g->quoteIds().size(); ++k) {
            Array up = groupParameters(*tight.calibrate(group("EUR-JOINT"), market.withBump(g->quoteIds()[k], h)));
            for (Size i = 0; i < g->parameterCount(); ++i)
                error = std::max(error, std::fabs((up[i] - base[i]) / h - d[i][k]));
        }
        BOOST_TEST_MESSAGE("bump " << h << ": maximum error " << error);
        errors.push_back(error);
    }

    for (Size j = 1; j < errors.size(); ++j)
        BOOST_CHECK_MESSAGE(errors[j] < errors[j - 1], "error " << errors[j] << " for bump #" << j
                                                                << " is not below " << errors[j - 1]);
    BOOST_CHECK_SMALL(errors.back(), 1.0e-3);
}

BOOST_FIXTURE_TEST_CASE(testThreeCurveGroup, TestMarket) {

    BOOST_TEST_MESSAGE("Testing calibration of an ESTR, a EURIBOR 6M and a EURIBOR 3M curve...");

    auto g = calibrator->calibrate(group("EUR-THREE-CURVE"), market);

    // discount curve first, the 3M curve needs the 6M curve for the basis swaps
    BOOST_REQUIRE_EQUAL(g->layers().size(), 3);
    BOOST_CHECK(g->layers()[0] == vector<string>{"EUR-ESTR"});
    BOOST_CHECK(g->layers()[1] == vector<string>{"EUR-EURIBOR-6M"});
    BOOST_CHECK(g->layers()[2] == vector<string>{"EUR-EURIBOR-3M"});
    BOOST_REQUIRE_EQUAL(g->parameterCount(), 20);
    BOOST_REQUIRE_EQUAL(g->quoteIds().size(), 20);
    BOOST_CHECK_SMALL(maxResidual(*g), 1.0e-10);

    Size estr = g->parameterOffset("EUR-ESTR");
    Size sixM = g->parameterOffset("EUR-EURIBOR-6M");
    Size threeM = g->parameterOffset("EUR-EURIBOR-3M");
    const Matrix& j = g->jacobian();
    for (Size r = estr; r < estr + 7; ++r)
        for (Size c : {sixM, threeM})
            for (Size k = c; k < c + (c == sixM ? 7 : 6); ++k)
                BOOST_CHECK_EQUAL(j[r][k], 0.0);
    Real basisOn6M = 0.0;
    for (Size r = threeM + 3; r < threeM + 6; ++r)
        for (Size k = sixM; k < sixM + 7; ++k)
            basisOn6M += std::fabs(j[r][k]);
    BOOST_CHECK(basisOn6M > 0.0);

    // log natural cubic interpolation of positive forwards
    const Array& df = g->curve("EUR-EURIBOR-3M").parameters();
    BOOST_REQUIRE_EQUAL(df.size(), 6);
    BOOST_CHECK(df[0] < 1.0);
    for (Size i = 1; i < df.size(); ++i)
        BOOST_CHECK_MESSAGE(df[i] < df[i - 1], "discount factor " << i << " is " << df[i] << ", previous "
                                                                  << df[i - 1]);

    const Matrix& d = g->parameterQuoteDerivatives();
    const Real h = 1.0e-5;
    for (Size k = 0; k < g->quoteIds().size(); ++k) {
        const string& id = g->quoteIds()[k];
        Array up = groupParameters(*calibrator->calibrate(group("EUR-THREE-CURVE"), market.withBump(id, h)));
        Array down = groupParameters(*calibrator->calibrate(group("EUR-THREE-CURVE"), market.withBump(id, -h)));
        for (Size i = 0; i < g->parameterCount(); ++i) {
            Real fd = (up[i] - down[i]) / (2.0 * h);
            BOOST_CHECK_MESSAGE(std::fabs(fd - d[i][k]) < 1.0e-5, "parameter " << i << " quote " << id
                                                                                << ": bumped " << fd
                                                                                << ", analytic " << d[i][k]);
        }
    }
}

BOOST_FIXTURE_TEST_CASE(testSingularJacobian, TestMarket) {

    BOOST_TEST_MESSAGE("Testing calibration with a node that no instrument depends on...");

    // the 2027-01-04 node lies strictly between the dates of all instruments
    BOOST_CHECK_THROW(calibrator->calibrate(group("EUR-SINGULAR"), market), SingularJacobianError);

    CalibrationOutcome outcome = calibrator->tryCalibrate(group("EUR-SINGULAR"), market);
    BOOST_REQUIRE(failure(outcome));
    BOOST_CHECK_EQUAL(failure(outcome)->kind, CalibrationError::Kind::SingularJacobian);
    BOOST_CHECK_EQUAL(failure(outcome)->groupName, "EUR-SINGULAR");
}

BOOST_FIXTURE_TEST_CASE(testGroupCurveClashesWithSeed, TestMarket) {

    BOOST_TEST_MESSAGE("Testing a group curve that is also given as a seed curve...");

    auto ois = calibrator->calibrate(group("EUR-OIS"), market);
    BOOST_CHECK_THROW(calibrator->calibrate(group("EUR-OIS"), market, ois->curves()), InvalidCurveNodeError);

    CalibrationOutcome outcome = calibrator->tryCalibrate(group("EUR-OIS"), market, ois->curves());
    BOOST_REQUIRE(failure(outcome));
    BOOST_CHECK_EQUAL(failure(outcome)->kind, CalibrationError::Kind::InvalidCurveNode);
    BOOST_CHECK_EQUAL(failure(outcome)->groupName, "EUR-OIS");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

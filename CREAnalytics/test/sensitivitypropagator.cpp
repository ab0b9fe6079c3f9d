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

#include <crea/engine/sensitivitypropagator.hpp>

#include <cred/portfolio/trade.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace std;
using namespace boost::unit_test_framework;
using namespace QuantLib;
using namespace cre::data;
using namespace cre::analytics;
using namespace CurveExt;
using testsuite::TestMarket;

namespace {

struct SensitivityData : public TestMarket {
    SensitivityData() {
        ois = calibrator->calibrate(group("EUR-OIS"), market);
        ibor = calibrator->calibrate(group("EUR-6M"), market, ois->curves());
    }

    Trade trade(const string& id, const CurveNodeInstrument& instrument, Real rate, Real notional) const {
        Trade t(id, instrument, rate, notional);
        t.build(calibrator->builder(), asof);
        return t;
    }

    QuantLib::ext::shared_ptr<const CalibratedCurveGroup> ois, ibor;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(CREAnalyticsTestSuite, cre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(SensitivityPropagatorTests)

BOOST_FIXTURE_TEST_CASE(testParameterSensitivity, SensitivityData) {

    BOOST_TEST_MESSAGE("Testing parameter sensitivities against bumped curve parameters...");

    Trade swap = trade("SWAP_4Y", FixedFloatSwapNode("EUR-6M-SWAP", 4 * Years), 0.024, 1.0e6);
    SensitivityPropagator propagator(ibor);
    CurrencyParameterSensitivities s = propagator.parameterSensitivity(swap.presentValue(ibor->curves()).sensitivities);

    // discounted on the OIS curve, projected on the 6M curve
    BOOST_CHECK_EQUAL(s.size(), 2);
    const Real h = 1.0e-6;
    for (auto const& name : {"EUR-ESTR", "EUR-EURIBOR-6M"}) {
        auto cs = s.find(name, "EUR");
        BOOST_REQUIRE(cs);
        const InterpolatedParameterCurve& c = ibor->curve(name);
        BOOST_REQUIRE_EQUAL(cs->sensitivity.size(), c.parameterCount());
        BOOST_CHECK(cs->metadata == c.parameterMetadata());
        for (Size i = 0; i < c.parameterCount(); ++i) {
            Real p = c.parameters()[i];
            Real up = swap.presentValue(ibor->curves().withCurves({c.withParameter(i, p + h)})).value;
            Real down = swap.presentValue(ibor->curves().withCurves({c.withParameter(i, p - h)})).value;
            Real fd = (up - down) / (2.0 * h);
            BOOST_CHECK_MESSAGE(std::fabs(fd - cs->sensitivity[i]) < 1.0e-3 * std::max(1.0, std::fabs(fd)),
                                name << " parameter " << i << ": bumped " << fd << ", analytic "
                                     << cs->sensitivity[i]);
        }
    }
}

BOOST_FIXTURE_TEST_CASE(testMarketQuoteSensitivity, SensitivityData) {

    BOOST_TEST_MESSAGE("Testing market quote sensitivities against bump and recalibrate...");

    Trade swap = trade("OIS_4Y", FixedFloatSwapNode("EUR-ESTR-OIS", 4 * Years), 0.022, 1.0e6);
    SensitivityPropagator propagator(ois);
    MarketQuoteSensitivities mq = propagator.toMarketQuoteSensitivity(swap.presentValue(ois->curves()).sensitivities);
    BOOST_CHECK(!mq.empty());

    const Real h = 1.0e-5;
    for (auto const& id : ois->quoteIds()) {
        Real up = swap.presentValue(calibrator->calibrate(group("EUR-OIS"), market.withBump(id, h))->curves()).value;
        Real down =
            swap.presentValue(calibrator->calibrate(group("EUR-OIS"), market.withBump(id, -h))->curves()).value;
        Real fd = (up - down) / (2.0 * h);
        auto analytic = mq.find(id, "EUR");
        Real a = analytic ? *analytic : 0.0;
        BOOST_CHECK_MESSAGE(std::fabs(fd - a) < 10.0, "quote " << id << ": bumped " << fd << ", analytic " << a);
    }

    // quotes beyond the swap maturity do not matter for linear interpolation in log discount factors
    auto longEnd = mq.find("IR_SWAP/RATE/EUR/2D/1D/10Y", "EUR");
    BOOST_CHECK(!longEnd || std::fabs(*longEnd) < 1.0e-6);
}

BOOST_FIXTURE_TEST_CASE(testSensitivityRoundTrip, SensitivityData) {

    BOOST_TEST_MESSAGE("Testing quote sensitivities against a simultaneous bump of all quotes...");

    Trade swap = trade("OIS_4Y", FixedFloatSwapNode("EUR-ESTR-OIS", 4 * Years), 0.022, 1.0e6);
    InstrumentValue base = swap.presentValue(ois->curves());
    MarketQuoteSensitivities mq = SensitivityPropagator(ois).toMarketQuoteSensitivity(base.sensitivities);

    // a different bump for every quote, the first order prediction error is quadratic in the bump size
    const vector<string>& ids = ois->quoteIds();
    vector<Real> relativeErrors;
    for (Real e : {1.0e-4, 1.0e-5}) {
        MarketQuotes bumped = market;
        Real predicted = 0.0;
        for (Size k = 0; k < ids.size(); ++k) {
            Real bump = e * (1.0 + static_cast<Real>(k) / ids.size());
            bumped = bumped.withBump(ids[k], bump);
            auto s = mq.find(ids[k], "EUR");
            predicted += (s ? *s : 0.0) * bump;
        }
        Real actual = swap.presentValue(calibrator->calibrate(group("EUR-OIS"), bumped)->curves()).value - base.value;
        BOOST_TEST_MESSAGE("bump " << e << ": actual " << actual << ", predicted " << predicted);
        BOOST_REQUIRE(std::fabs(predicted) > 0.0);
        relativeErrors.push_back(std::fabs(actual - predicted) / std::fabs(predicted));
    }

    BOOST_CHECK(relativeErrors[1] < relativeErrors[0]);
    BOOST_CHECK_SMALL(relativeErrors[1], 1.0e-3);
}

BOOST_FIXTURE_TEST_CASE(testCalibrationInstrumentAtPar, SensitivityData) {

    BOOST_TEST_MESSAGE("Testing quote sensitivities of a calibration instrument at par...");

    const string id = "IR_SWAP/RATE/EUR/2D/1D/5Y";
    Real notional = 1.0e6;
    Trade swap = trade("OIS_5Y", FixedFloatSwapNode("EUR-ESTR-OIS", 5 * Years), *market.get(id), notional);
    BOOST_CHECK_SMALL(swap.presentValue(ois->curves()).value, 1.0e-4);

    // sensitive to its own quote only, with the annuity as sensitivity
    MarketQuoteSensitivities mq = SensitivityPropagator(ois).toMarketQuoteSensitivity(
        swap.presentValue(ois->curves()).sensitivities);
    Real annuity = swap.calibrationInstrument()->annuity(ois->curves()).value;
    BOOST_REQUIRE(mq.find(id, "EUR"));
    BOOST_CHECK_CLOSE(*mq.find(id, "EUR"), notional * annuity, 1.0e-6);
    for (auto const& q : mq.data()) {
        if (q.first.first != id)
            BOOST_CHECK_SMALL(q.second, 1.0e-4);
    }
    BOOST_CHECK_CLOSE(mq.total(), notional * annuity, 1.0e-6);
}

BOOST_FIXTURE_TEST_CASE(testSeedSensitivities, SensitivityData) {

    BOOST_TEST_MESSAGE("Testing sensitivities to seed curves...");

    Trade swap = trade("SWAP_4Y", FixedFloatSwapNode("EUR-6M-SWAP", 4 * Years), 0.024, 1.0e6);
    SensitivityPropagator propagator(ibor);
    CurrencyParameterSensitivities parameters =
        propagator.parameterSensitivity(swap.presentValue(ibor->curves()).sensitivities);

    // the OIS curve is a seed of the 6M group, its sensitivities stay parameter sensitivities
    CurrencyParameterSensitivities seeds = propagator.seedSensitivities(parameters);
    BOOST_CHECK_EQUAL(seeds.size(), 1);
    BOOST_CHECK(seeds.find("EUR-ESTR", "EUR"));
    BOOST_CHECK(!seeds.find("EUR-EURIBOR-6M", "EUR"));
    BOOST_CHECK_CLOSE(seeds.total(), parameters.find("EUR-ESTR", "EUR")->total(), 1.0e-12);

    // market quote sensitivities only refer to the quotes of the group
    MarketQuoteSensitivities mq = propagator.toMarketQuoteSensitivity(parameters);
    for (auto const& q : mq.data()) {
        BOOST_CHECK(std::find(ibor->quoteIds().begin(), ibor->quoteIds().end(), q.first.first) !=
                    ibor->quoteIds().end());
        BOOST_CHECK_EQUAL(q.first.second, "EUR");
    }

    // in the joint group the OIS part is converted to OIS quotes
    auto joint = calibrator->calibrate(group("EUR-JOINT"), market);
    SensitivityPropagator jointPropagator(joint);
    CurrencyParameterSensitivities jointParameters =
        jointPropagator.parameterSensitivity(swap.presentValue(joint->curves()).sensitivities);
    BOOST_CHECK(jointPropagator.seedSensitivities(jointParameters).empty());
    MarketQuoteSensitivities jointMq = jointPropagator.toMarketQuoteSensitivity(jointParameters);
    BOOST_CHECK(jointMq.size() > mq.size());

    // the 6M quotes have the same sensitivities in both setups
    for (auto const& q : mq.data()) {
        auto j = jointMq.find(q.first.first, q.first.second);
        BOOST_CHECK_SMALL((j ? *j : 0.0) - q.second, 1.0e-6 * std::max(1.0, std::fabs(q.second)));
    }
}

BOOST_AUTO_TEST_CASE(testNoGroup) {

    BOOST_TEST_MESSAGE("Testing propagator without calibrated group...");

    QuantLib::ext::shared_ptr<const CalibratedCurveGroup> none;
    BOOST_CHECK_THROW(SensitivityPropagator propagator(none), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

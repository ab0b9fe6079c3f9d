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

#include <crea/engine/curvedependencygraph.hpp>

#include <cve/utilities/calibrationerror.hpp>

using namespace std;
using namespace boost::unit_test_framework;
using namespace QuantLib;
using namespace cre::data;
using namespace cre::analytics;
using namespace CurveExt;
using testsuite::TestMarket;

namespace {

CurveRequirements requirements(const set<string>& currencies, const set<string>& indices) {
    CurveRequirements r;
    r.discountCurrencies = currencies;
    r.indices = indices;
    return r;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(CREAnalyticsTestSuite, cre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(CurveDependencyGraphTests)

BOOST_FIXTURE_TEST_CASE(testSingleCurve, TestMarket) {

    BOOST_TEST_MESSAGE("Testing dependency graph of a self-contained curve...");

    map<string, CurveRequirements> req = {{"EUR-ESTR", requirements({"EUR"}, {"EUR-ESTR"})}};
    CurveDependencyGraph graph(group("EUR-OIS"), req, CurveExt::RatesCurveProvider());

    BOOST_REQUIRE_EQUAL(graph.layers().size(), 1);
    BOOST_CHECK_EQUAL(graph.layers()[0].size(), 1);
    BOOST_CHECK_EQUAL(graph.layers()[0][0], "EUR-ESTR");
    BOOST_CHECK(graph.dependencies("EUR-ESTR").empty());
    BOOST_CHECK(graph.seedDependencies("EUR-ESTR").empty());
    BOOST_CHECK_EQUAL(boost::num_vertices(graph.graph()), 1);
    BOOST_CHECK_EQUAL(boost::num_edges(graph.graph()), 0);
}

BOOST_FIXTURE_TEST_CASE(testLayers, TestMarket) {

    BOOST_TEST_MESSAGE("Testing calibration layers of dependent curves...");

    map<string, CurveRequirements> req = {{"EUR-ESTR", requirements({"EUR"}, {"EUR-ESTR"})},
                                          {"EUR-EURIBOR-6M", requirements({"EUR"}, {"EUR-EURIBOR-6M"})}};
    CurveDependencyGraph graph(group("EUR-JOINT"), req, CurveExt::RatesCurveProvider());

    BOOST_REQUIRE_EQUAL(graph.layers().size(), 2);
    BOOST_CHECK(graph.layers()[0] == vector<string>({"EUR-ESTR"}));
    BOOST_CHECK(graph.layers()[1] == vector<string>({"EUR-EURIBOR-6M"}));
    BOOST_CHECK(graph.dependencies("EUR-EURIBOR-6M") == set<string>({"EUR-ESTR"}));
    BOOST_CHECK(graph.dependencies("EUR-ESTR").empty());
    BOOST_CHECK_EQUAL(boost::num_edges(graph.graph()), 1);
    BOOST_CHECK_THROW(graph.dependencies("EUR-EURIBOR-3M"), QuantLib::Error);

    // curves without mutual dependencies share a layer
    req["EUR-EURIBOR-6M"] = requirements({}, {"EUR-EURIBOR-6M"});
    CurveDependencyGraph flat(group("EUR-JOINT"), req, CurveExt::RatesCurveProvider());
    BOOST_REQUIRE_EQUAL(flat.layers().size(), 1);
    BOOST_CHECK(flat.layers()[0] == vector<string>({"EUR-EURIBOR-6M", "EUR-ESTR"}));
}

BOOST_FIXTURE_TEST_CASE(testSeedDependencies, TestMarket) {

    BOOST_TEST_MESSAGE("Testing dependencies on seed curves...");

    auto ois = calibrator->calibrate(group("EUR-OIS"), market);
    map<string, CurveRequirements> req = {{"EUR-EURIBOR-6M", requirements({"EUR"}, {"EUR-EURIBOR-6M"})}};

    CurveDependencyGraph graph(group("EUR-6M"), req, ois->curves());
    BOOST_REQUIRE_EQUAL(graph.layers().size(), 1);
    BOOST_CHECK(graph.dependencies("EUR-EURIBOR-6M").empty());
    BOOST_CHECK(graph.seedDependencies("EUR-EURIBOR-6M") == set<string>({"EUR-ESTR"}));

    // without the seed the discount curve cannot be resolved
    BOOST_CHECK_THROW(CurveDependencyGraph(group("EUR-6M"), req, CurveExt::RatesCurveProvider()),
                      InvalidCurveNodeError);

    // an index that is neither in the group nor a seed
    req["EUR-EURIBOR-6M"].indices.insert("USD-SOFR");
    BOOST_CHECK_THROW(CurveDependencyGraph(group("EUR-6M"), req, ois->curves()), InvalidCurveNodeError);
}

BOOST_FIXTURE_TEST_CASE(testCycle, TestMarket) {

    BOOST_TEST_MESSAGE("Testing cyclic dependencies between curves...");

    map<string, CurveRequirements> req = {
        {"EUR-EURIBOR-3M", requirements({"EUR"}, {"EUR-EURIBOR-3M", "EUR-EURIBOR-6M"})},
        {"EUR-EURIBOR-6M", requirements({"EUR"}, {"EUR-EURIBOR-6M"})}};
    BOOST_CHECK_THROW(CurveDependencyGraph(group("EUR-CYCLIC"), req, CurveExt::RatesCurveProvider()),
                      CyclicCurveDependencyError);

    // once the 3M curve no longer projects off the 6M curve the order is well defined
    req["EUR-EURIBOR-3M"].indices.erase("EUR-EURIBOR-6M");
    CurveDependencyGraph graph(group("EUR-CYCLIC"), req, CurveExt::RatesCurveProvider());
    BOOST_REQUIRE_EQUAL(graph.layers().size(), 2);
    BOOST_CHECK(graph.layers()[0] == vector<string>({"EUR-EURIBOR-3M"}));
    BOOST_CHECK(graph.layers()[1] == vector<string>({"EUR-EURIBOR-6M"}));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

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
#include <cret/datapaths.hpp>
#include <cret/toplevelfixture.hpp>

#include <cred/configuration/curvedefinition.hpp>

#include <ql/time/daycounters/actual360.hpp>
#include <ql/time/daycounters/actual365fixed.hpp>

using namespace std;
using namespace boost::unit_test_framework;
using namespace QuantLib;
using namespace cre::data;

namespace {

vector<CurveNode> oisNodes() {
    vector<CurveNode> nodes;
    nodes.push_back(CurveNode("MM/RATE/EUR/0D/1D", TermDepositNode("EUR-ON-DEPOSIT", 1 * Days)));
    nodes.push_back(CurveNode("IR_SWAP/RATE/EUR/2D/1D/1Y", FixedFloatSwapNode("EUR-ESTR-OIS", 1 * Years)));
    nodes.push_back(CurveNode("IR_SWAP/RATE/EUR/2D/1D/2Y", FixedFloatSwapNode("EUR-ESTR-OIS", 2 * Years)));
    return nodes;
}

vector<CurveNode> iborNodes() {
    vector<CurveNode> nodes;
    nodes.push_back(CurveNode("MM/RATE/EUR/2D/6M", IborFixingDepositNode("EUR-EURIBOR-6M")));
    nodes.push_back(CurveNode("FRA/RATE/EUR/6M/6M", FraNode("EUR-6M-FRA", 6 * Months)));
    return nodes;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(CREDataTestSuite, cre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(CurveDefinitionTests)

BOOST_AUTO_TEST_CASE(testCurveNodeFromXml) {

    BOOST_TEST_MESSAGE("Testing curve node parsing...");

    string xml = "<Node>"
                 "<QuoteId>IR_SWAP/RATE/EUR/2D/6M/1Yx6Y</QuoteId>"
                 "<Swap><Convention>EUR-6M-SWAP</Convention><Tenor>6Y</Tenor><ForwardStart>1Y</ForwardStart></Swap>"
                 "<Spread>0.0005</Spread>"
                 "<Label>FWD-1Yx6Y</Label>"
                 "<NodeDate>LastFixing</NodeDate>"
                 "</Node>";
    CurveNode node;
    node.fromXMLString(xml);

    BOOST_CHECK_EQUAL(node.quoteId(), "IR_SWAP/RATE/EUR/2D/6M/1Yx6Y");
    BOOST_CHECK_EQUAL(node.instrumentType(), "Swap");
    BOOST_CHECK_EQUAL(node.conventionId(), "EUR-6M-SWAP");
    BOOST_CHECK_CLOSE(node.spread(), 0.0005, 1.0e-12);
    BOOST_CHECK_EQUAL(node.label(), "FWD-1Yx6Y");
    BOOST_CHECK(node.nodeDate() == NodeDate::lastFixing());

    const FixedFloatSwapNode* swap = boost::get<FixedFloatSwapNode>(&node.instrument());
    BOOST_REQUIRE(swap);
    BOOST_CHECK_EQUAL(swap->tenor, 6 * Years);
    BOOST_CHECK_EQUAL(swap->forwardStart, 1 * Years);

    // defaults
    CurveNode simple;
    simple.fromXMLString("<Node><QuoteId>MM/RATE/EUR/2D/6M</QuoteId>"
                         "<IborFixingDeposit><Convention>EUR-EURIBOR-6M</Convention></IborFixingDeposit></Node>");
    BOOST_CHECK_EQUAL(simple.instrumentType(), "IborFixingDeposit");
    BOOST_CHECK_EQUAL(simple.spread(), 0.0);
    BOOST_CHECK(simple.label().empty());
    BOOST_CHECK(simple.nodeDate() == NodeDate::end());
}

BOOST_AUTO_TEST_CASE(testCurveNodeXmlErrors) {

    BOOST_TEST_MESSAGE("Testing invalid curve node xml...");

    CurveNode node;
    // no instrument
    BOOST_CHECK_THROW(node.fromXMLString("<Node><QuoteId>Q</QuoteId></Node>"), QuantLib::Error);
    // two instruments
    BOOST_CHECK_THROW(node.fromXMLString("<Node><QuoteId>Q</QuoteId>"
                                         "<FRA><Convention>C</Convention><PeriodToStart>3M</PeriodToStart></FRA>"
                                         "<Deposit><Convention>C</Convention><Tenor>3M</Tenor></Deposit></Node>"),
                      QuantLib::Error);
    // unknown instrument
    BOOST_CHECK_THROW(node.fromXMLString("<Node><QuoteId>Q</QuoteId><Bond><Convention>C</Convention></Bond></Node>"),
                      QuantLib::Error);
    // future year out of range
    BOOST_CHECK_THROW(node.fromXMLString("<Node><QuoteId>Q</QuoteId><Future><Convention>C</Convention>"
                                         "<Year>1850</Year><Month>Mar</Month></Future></Node>"),
                      QuantLib::Error);
    // missing quote id
    BOOST_CHECK_THROW(node.fromXMLString("<Node><Deposit><Convention>C</Convention><Tenor>3M</Tenor></Deposit></Node>"),
                      QuantLib::Error);
    BOOST_CHECK_THROW(CurveNode("", TermDepositNode("C", 3 * Months)), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testCurveNodeRoundTrip) {

    BOOST_TEST_MESSAGE("Testing curve node xml round trip for each instrument type...");

    vector<CurveNode> nodes;
    nodes.push_back(CurveNode("Q1", TermDepositNode("EUR-ON-DEPOSIT", 1 * Days)));
    nodes.push_back(CurveNode("Q2", IborFixingDepositNode("EUR-EURIBOR-6M"), 0.0, "", NodeDate::lastFixing()));
    nodes.push_back(CurveNode("Q3", FraNode("EUR-6M-FRA", 3 * Months), 0.0001, "3x9"));
    nodes.push_back(CurveNode("Q4", FixedFloatSwapNode("EUR-6M-SWAP", 5 * Years, 2 * Years)));
    nodes.push_back(CurveNode("Q5", BasisSwapNode("EUR-3M-6M-BASIS", 10 * Years), 0.0, "",
                              NodeDate::fixed(Date(5, July, 2036))));
    nodes.push_back(CurveNode("Q6", IborFutureNode("EUR-EURIBOR-3M-FUTURE", 2027, March)));

    for (auto const& n : nodes) {
        BOOST_TEST_MESSAGE("  " << n.instrumentType());
        string xml = n.toXMLString();
        CurveNode copy;
        copy.fromXMLString(xml);
        BOOST_CHECK_EQUAL(copy.quoteId(), n.quoteId());
        BOOST_CHECK_EQUAL(copy.instrumentType(), n.instrumentType());
        BOOST_CHECK_EQUAL(copy.conventionId(), n.conventionId());
        BOOST_CHECK_EQUAL(copy.spread(), n.spread());
        BOOST_CHECK_EQUAL(copy.label(), n.label());
        BOOST_CHECK(copy.nodeDate() == n.nodeDate());
        BOOST_CHECK_EQUAL(copy.toXMLString(), xml);
    }

    CurveNode future;
    future.fromXMLString(nodes.back().toXMLString());
    const IborFutureNode* f = boost::get<IborFutureNode>(&future.instrument());
    BOOST_REQUIRE(f);
    BOOST_CHECK_EQUAL(f->year, 2027);
    BOOST_CHECK_EQUAL(f->month, March);
}

BOOST_AUTO_TEST_CASE(testNodeDate) {

    BOOST_TEST_MESSAGE("Testing node date rules...");

    BOOST_CHECK(parseNodeDate("") == NodeDate::end());
    BOOST_CHECK(parseNodeDate("End") == NodeDate::end());
    BOOST_CHECK(parseNodeDate("LastFixing") == NodeDate::lastFixing());
    NodeDate fixed = parseNodeDate("2030-01-15");
    BOOST_CHECK(fixed.type() == NodeDate::Type::Fixed);
    BOOST_CHECK_EQUAL(fixed.date(), Date(15, January, 2030));
    BOOST_CHECK(!(fixed == NodeDate::end()));
    BOOST_CHECK_THROW(parseNodeDate("Start"), QuantLib::Error);
    BOOST_CHECK_THROW(NodeDate(NodeDate::Type::Fixed), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testCurveDefinitionConstruction) {

    BOOST_TEST_MESSAGE("Testing curve definition construction...");

    CurveDefinition curve("EUR-ESTR", "EUR", oisNodes(), CurveExt::CurveValueType::LogDiscountFactor,
                          CurveExt::Interpolator::Linear, CurveExt::Extrapolator::Flat,
                          CurveExt::Extrapolator::Linear);
    BOOST_CHECK_EQUAL(curve.parameterCount(), 3);
    BOOST_CHECK_EQUAL(curve.dayCounter(), Actual365Fixed());
    BOOST_CHECK(curve.rightExtrapolator() == CurveExt::Extrapolator::Linear);

    // log interpolation is only meaningful on discount factors
    BOOST_CHECK_NO_THROW(CurveDefinition("C", "EUR", oisNodes(), CurveExt::CurveValueType::DiscountFactor,
                                         CurveExt::Interpolator::LogNaturalCubic));
    BOOST_CHECK_THROW(CurveDefinition("C", "EUR", oisNodes(), CurveExt::CurveValueType::ZeroRate,
                                      CurveExt::Interpolator::LogLinear),
                      QuantLib::Error);
    BOOST_CHECK_THROW(CurveDefinition("C", "EUR", oisNodes(), CurveExt::CurveValueType::LogDiscountFactor,
                                      CurveExt::Interpolator::LogLinear),
                      QuantLib::Error);

    BOOST_CHECK_THROW(CurveDefinition("", "EUR", oisNodes(), CurveExt::CurveValueType::ZeroRate,
                                      CurveExt::Interpolator::Linear),
                      QuantLib::Error);
    BOOST_CHECK_THROW(CurveDefinition("C", "EUR", vector<CurveNode>(), CurveExt::CurveValueType::ZeroRate,
                                      CurveExt::Interpolator::Linear),
                      QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testCurveGroupChecks) {

    BOOST_TEST_MESSAGE("Testing curve group consistency checks...");

    CurveDefinition ois("EUR-ESTR", "EUR", oisNodes(), CurveExt::CurveValueType::ZeroRate,
                        CurveExt::Interpolator::Linear);
    CurveDefinition ibor("EUR-EURIBOR-6M", "EUR", iborNodes(), CurveExt::CurveValueType::DiscountFactor,
                         CurveExt::Interpolator::LogLinear, CurveExt::Extrapolator::Flat, CurveExt::Extrapolator::Flat,
                         Actual360());

    vector<CurveDefinition> curves = {ois, ibor};
    vector<CurveGroupEntry> entries = {CurveGroupEntry("EUR-ESTR", {"EUR"}, {"EUR-ESTR"}),
                                       CurveGroupEntry("EUR-EURIBOR-6M", {}, {"EUR-EURIBOR-6M"})};
    CurveGroupDefinition group("EUR", curves, entries);
    BOOST_CHECK_EQUAL(group.parameterCount(), 5);
    BOOST_CHECK(group.hasCurve("EUR-EURIBOR-6M"));
    BOOST_CHECK(!group.hasCurve("USD-SOFR"));
    BOOST_CHECK_EQUAL(group.curveDefinition("EUR-EURIBOR-6M").dayCounter(), Actual360());
    BOOST_CHECK_THROW(group.curveDefinition("USD-SOFR"), QuantLib::Error);
    BOOST_CHECK_EQUAL(group.entry("EUR-ESTR").discountCurrencies.size(), 1);

    // a curve without entry has no usages
    CurveGroupDefinition noEntries("EUR", curves, {});
    BOOST_CHECK(noEntries.entry("EUR-ESTR").discountCurrencies.empty());
    BOOST_CHECK(noEntries.entry("EUR-ESTR").indices.empty());

    // a currency can only be discounted on one curve
    vector<CurveGroupEntry> twoDiscount = {CurveGroupEntry("EUR-ESTR", {"EUR"}, {}),
                                           CurveGroupEntry("EUR-EURIBOR-6M", {"EUR"}, {})};
    BOOST_CHECK_THROW(CurveGroupDefinition("EUR", curves, twoDiscount), QuantLib::Error);

    // an index can only be projected from one curve
    vector<CurveGroupEntry> twoProjection = {CurveGroupEntry("EUR-ESTR", {}, {"EUR-EURIBOR-6M"}),
                                             CurveGroupEntry("EUR-EURIBOR-6M", {}, {"EUR-EURIBOR-6M"})};
    BOOST_CHECK_THROW(CurveGroupDefinition("EUR", curves, twoProjection), QuantLib::Error);

    // entries must refer to curves of the group
    vector<CurveGroupEntry> unknown = {CurveGroupEntry("USD-SOFR", {"USD"}, {})};
    BOOST_CHECK_THROW(CurveGroupDefinition("EUR", curves, unknown), QuantLib::Error);

    // duplicate curve names
    vector<CurveDefinition> twice = {ois, ois};
    BOOST_CHECK_THROW(CurveGroupDefinition("EUR", twice, {}), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testCurveGroupsFromFile) {

    BOOST_TEST_MESSAGE("Testing curve groups from file...");

    CurveGroupDefinitions groups;
    groups.fromFile(TEST_INPUT_FILE("curvegroups.xml"));

    BOOST_REQUIRE_EQUAL(groups.size(), 2);
    vector<string> names = groups.names();
    BOOST_CHECK_EQUAL(names[0], "EUR-6M");
    BOOST_CHECK_EQUAL(names[1], "EUR-JOINT");
    BOOST_CHECK_THROW(groups.get("USD"), QuantLib::Error);

    const CurveGroupDefinition& joint = groups.get("EUR-JOINT");
    BOOST_REQUIRE_EQUAL(joint.curveDefinitions().size(), 2);
    BOOST_CHECK_EQUAL(joint.parameterCount(), 6);
    // calibration order is the order in the file
    BOOST_CHECK_EQUAL(joint.curveDefinitions()[0].name(), "EUR-ESTR");
    BOOST_CHECK_EQUAL(joint.curveDefinitions()[1].name(), "EUR-EURIBOR-3M");

    const CurveDefinition& estr = joint.curveDefinition("EUR-ESTR");
    BOOST_CHECK(estr.valueType() == CurveExt::CurveValueType::ZeroRate);
    BOOST_CHECK(estr.interpolator() == CurveExt::Interpolator::NaturalCubic);
    BOOST_CHECK(estr.leftExtrapolator() == CurveExt::Extrapolator::Flat);
    BOOST_CHECK(estr.rightExtrapolator() == CurveExt::Extrapolator::Flat);
    BOOST_CHECK_EQUAL(estr.dayCounter(), Actual365Fixed());
    BOOST_CHECK_EQUAL(estr.nodes()[2].label(), "OIS-5Y");

    const CurveDefinition& ibor = joint.curveDefinition("EUR-EURIBOR-3M");
    BOOST_CHECK_EQUAL(ibor.dayCounter(), Actual360());
    BOOST_CHECK(ibor.rightExtrapolator() == CurveExt::Extrapolator::Linear);
    BOOST_CHECK_EQUAL(ibor.nodes()[0].instrumentType(), "IborFixingDeposit");
    BOOST_CHECK(ibor.nodes()[0].nodeDate() == NodeDate::lastFixing());
    BOOST_CHECK_EQUAL(ibor.nodes()[1].instrumentType(), "Future");
    BOOST_CHECK_CLOSE(ibor.nodes()[1].spread(), 0.0001, 1.0e-10);
    BOOST_CHECK_EQUAL(ibor.nodes()[2].instrumentType(), "BasisSwap");
    BOOST_CHECK(ibor.nodes()[2].nodeDate() == NodeDate::fixed(Date(3, July, 2028)));

    CurveGroupEntry e = joint.entry("EUR-EURIBOR-3M");
    BOOST_CHECK(e.discountCurrencies.empty());
    BOOST_REQUIRE_EQUAL(e.indices.size(), 1);
    BOOST_CHECK_EQUAL(e.indices[0], "EUR-EURIBOR-3M");

    // round trip of the whole file
    string xml = groups.toXMLString();
    CurveGroupDefinitions copy;
    copy.fromXMLString(xml);
    BOOST_CHECK_EQUAL(copy.size(), 2);
    BOOST_CHECK_EQUAL(copy.toXMLString(), xml);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

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

#include <cred/builders/calibrationinstrumentbuilder.hpp>

#include <cve/instruments/forwardrateagreement.hpp>
#include <cve/instruments/iborfixingdeposit.hpp>
#include <cve/instruments/iborfuture.hpp>
#include <cve/instruments/interestrateswap.hpp>
#include <cve/instruments/termdeposit.hpp>
#include <cve/utilities/calibrationerror.hpp>

#include <cmath>

using namespace std;
using namespace boost::unit_test_framework;
using namespace QuantLib;
using namespace cre::data;
using namespace CurveExt;

namespace {

struct BuilderData {
    BuilderData() : asof(30, June, 2026), quotes(asof) {
        Settings::instance().evaluationDate() = asof;
        auto conventions = QuantLib::ext::make_shared<Conventions>();
        conventions->fromFile(TEST_INPUT_FILE("conventions.xml"));
        builder = QuantLib::ext::make_shared<CalibrationInstrumentBuilder>(conventions);

        quotes.add("MM/RATE/EUR/0D/1D", 0.019);
        quotes.add("MM/RATE/EUR/2D/6M", 0.0212);
        quotes.add("FRA/RATE/EUR/6M/6M", 0.0218);
        quotes.add("IR_SWAP/RATE/EUR/2D/1D/1Y", 0.0195);
        quotes.add("IR_SWAP/RATE/EUR/2D/6M/1Yx6Y", 0.0265);
        quotes.add("BASIS_SWAP/BASIS_SPREAD/3M/6M/EUR/2Y", -0.0012);
        quotes.add("BASIS_SWAP/BASIS_SPREAD/ESTR/6M/EUR/2Y", 0.0025);
        quotes.add("MM_FUTURE/PRICE/EUR/2026-09/3M", 97.85);
    }

    Date asof;
    MarketQuotes quotes;
    QuantLib::ext::shared_ptr<CalibrationInstrumentBuilder> builder;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(CREDataTestSuite, cre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(CalibrationInstrumentBuilderTests)

BOOST_AUTO_TEST_CASE(testInitialGuess) {

    BOOST_TEST_MESSAGE("Testing initial guesses per curve value type...");

    BOOST_CHECK_CLOSE(initialGuess(CurveValueType::ZeroRate, 0.02, 5.0), 0.02, 1.0e-12);
    BOOST_CHECK_CLOSE(initialGuess(CurveValueType::DiscountFactor, 0.02, 5.0), std::exp(-0.1), 1.0e-12);
    BOOST_CHECK_CLOSE(initialGuess(CurveValueType::LogDiscountFactor, 0.02, 5.0), -0.1, 1.0e-12);
}

BOOST_FIXTURE_TEST_CASE(testTermDeposit, BuilderData) {

    BOOST_TEST_MESSAGE("Testing term deposit node...");

    CurveNode node("MM/RATE/EUR/0D/1D", TermDepositNode("EUR-ON-DEPOSIT", 1 * Days), 0.0005);
    BuiltInstrument b = builder->build(node, asof, quotes, CurveValueType::LogDiscountFactor);

    auto deposit = QuantLib::ext::dynamic_pointer_cast<TermDeposit>(b.instrument);
    BOOST_REQUIRE(deposit);
    BOOST_CHECK_EQUAL(deposit->startDate(), asof);
    BOOST_CHECK_EQUAL(deposit->endDate(), Date(1, July, 2026));
    BOOST_CHECK_CLOSE(deposit->yearFraction(), 1.0 / 360.0, 1.0e-10);
    // quote plus node spread
    BOOST_CHECK_CLOSE(deposit->fixedRate(), 0.0195, 1.0e-10);

    BOOST_CHECK_EQUAL(b.nodeDate, Date(1, July, 2026));
    BOOST_CHECK_EQUAL(b.metadata.label, "1D");
    BOOST_CHECK_EQUAL(b.metadata.date, b.nodeDate);
    BOOST_CHECK_CLOSE(b.initialGuess, -0.0195 / 365.0, 1.0e-8);

    BOOST_CHECK_EQUAL(builder->nodeDate(node, asof), b.nodeDate);
    BOOST_CHECK(builder->metadata(node, asof) == b.metadata);
}

BOOST_FIXTURE_TEST_CASE(testIborNodes, BuilderData) {

    BOOST_TEST_MESSAGE("Testing ibor fixing deposit and FRA nodes...");

    CurveNode depositNode("MM/RATE/EUR/2D/6M", IborFixingDepositNode("EUR-EURIBOR-6M"));
    BuiltInstrument d = builder->build(depositNode, asof, quotes, CurveValueType::ZeroRate);
    auto deposit = QuantLib::ext::dynamic_pointer_cast<IborFixingDeposit>(d.instrument);
    BOOST_REQUIRE(deposit);
    BOOST_CHECK_EQUAL(deposit->index(), "EUR-EURIBOR-6M");
    BOOST_CHECK_EQUAL(deposit->startDate(), Date(2, July, 2026));
    // 2 Jan 2027 is a Saturday
    BOOST_CHECK_EQUAL(deposit->endDate(), Date(4, January, 2027));
    BOOST_CHECK_EQUAL(d.metadata.label, "6M");
    BOOST_CHECK_CLOSE(d.initialGuess, 0.0212, 1.0e-12);

    CurveNode fraNode("FRA/RATE/EUR/6M/6M", FraNode("EUR-6M-FRA", 6 * Months));
    BuiltInstrument f = builder->build(fraNode, asof, quotes, CurveValueType::DiscountFactor);
    auto fra = QuantLib::ext::dynamic_pointer_cast<ForwardRateAgreement>(f.instrument);
    BOOST_REQUIRE(fra);
    BOOST_CHECK_EQUAL(fra->startDate(), Date(4, January, 2027));
    BOOST_CHECK_EQUAL(fra->endDate(), Date(5, July, 2027));
    BOOST_CHECK_EQUAL(f.nodeDate, fra->endDate());
    BOOST_CHECK_EQUAL(f.metadata.label, "6Mx12M");
    Time t = Actual365Fixed().yearFraction(asof, f.nodeDate);
    BOOST_CHECK_CLOSE(f.initialGuess, std::exp(-0.0218 * t), 1.0e-10);

    // the last fixing of a FRA ends with the FRA
    CurveNode lastFixing("FRA/RATE/EUR/6M/6M", FraNode("EUR-6M-FRA", 6 * Months), 0.0, "FRA-6x12",
                         NodeDate::lastFixing());
    BuiltInstrument l = builder->build(lastFixing, asof, quotes, CurveValueType::ZeroRate);
    BOOST_CHECK_EQUAL(l.nodeDate, fra->endDate());
    BOOST_CHECK_EQUAL(l.metadata.label, "FRA-6x12");
}

BOOST_FIXTURE_TEST_CASE(testSwapNodes, BuilderData) {

    BOOST_TEST_MESSAGE("Testing fixed vs floating swap nodes...");

    CurveNode oisNode("IR_SWAP/RATE/EUR/2D/1D/1Y", FixedFloatSwapNode("EUR-ESTR-OIS", 1 * Years));
    BuiltInstrument o = builder->build(oisNode, asof, quotes, CurveValueType::ZeroRate);
    auto ois = QuantLib::ext::dynamic_pointer_cast<InterestRateSwap>(o.instrument);
    BOOST_REQUIRE(ois);
    BOOST_CHECK_EQUAL(ois->currency(), "EUR");
    BOOST_CHECK(ois->quotedLeg().type() == SwapLeg::Type::Fixed);
    BOOST_CHECK(ois->otherLeg().type() == SwapLeg::Type::Overnight);
    BOOST_CHECK_EQUAL(ois->otherLeg().index(), "EUR-ESTR");
    // annual overnight leg by default
    BOOST_CHECK_EQUAL(ois->quotedLeg().periods().size(), 1);
    BOOST_CHECK_EQUAL(ois->otherLeg().periods().size(), 1);
    BOOST_CHECK_EQUAL(ois->quotedLeg().periods().front().accrualStart, Date(2, July, 2026));
    BOOST_CHECK_EQUAL(o.nodeDate, Date(2, July, 2027));
    BOOST_CHECK_EQUAL(o.metadata.label, "1Y");
    BOOST_CHECK_CLOSE(ois->fixedRate(), 0.0195, 1.0e-12);

    CurveNode fwdNode("IR_SWAP/RATE/EUR/2D/6M/1Yx6Y", FixedFloatSwapNode("EUR-6M-SWAP", 6 * Years, 1 * Years));
    BuiltInstrument s = builder->build(fwdNode, asof, quotes, CurveValueType::ZeroRate);
    auto swap = QuantLib::ext::dynamic_pointer_cast<InterestRateSwap>(s.instrument);
    BOOST_REQUIRE(swap);
    BOOST_CHECK(swap->otherLeg().type() == SwapLeg::Type::Ibor);
    BOOST_CHECK_EQUAL(swap->quotedLeg().periods().size(), 6);
    BOOST_CHECK_EQUAL(swap->otherLeg().periods().size(), 12);
    BOOST_CHECK_EQUAL(swap->quotedLeg().periods().front().accrualStart, Date(2, July, 2027));
    BOOST_CHECK_EQUAL(s.nodeDate, swap->maturityDate());
    BOOST_CHECK_EQUAL(s.metadata.label, "1Yx6Y");

    // the last ibor fixing period may end after the swap
    CurveNode lastFixing("IR_SWAP/RATE/EUR/2D/6M/1Yx6Y", FixedFloatSwapNode("EUR-6M-SWAP", 6 * Years, 1 * Years),
                         0.0, "", NodeDate::lastFixing());
    BOOST_CHECK(builder->nodeDate(lastFixing, asof) >= s.nodeDate);
    BOOST_CHECK_EQUAL(builder->nodeDate(lastFixing, asof), swap->otherLeg().periods().back().fixingEnd);
}

BOOST_FIXTURE_TEST_CASE(testBasisSwapNodes, BuilderData) {

    BOOST_TEST_MESSAGE("Testing basis swap nodes...");

    CurveNode iborNode("BASIS_SWAP/BASIS_SPREAD/3M/6M/EUR/2Y", BasisSwapNode("EUR-3M-6M-BASIS", 2 * Years));
    BuiltInstrument b = builder->build(iborNode, asof, quotes, CurveValueType::ZeroRate);
    auto swap = QuantLib::ext::dynamic_pointer_cast<InterestRateSwap>(b.instrument);
    BOOST_REQUIRE(swap);
    BOOST_CHECK_EQUAL(swap->quotedLeg().index(), "EUR-EURIBOR-3M");
    BOOST_CHECK_EQUAL(swap->otherLeg().index(), "EUR-EURIBOR-6M");
    BOOST_CHECK_EQUAL(swap->quotedLeg().periods().size(), 8);
    BOOST_CHECK_EQUAL(swap->otherLeg().periods().size(), 4);
    BOOST_CHECK_CLOSE(swap->fixedRate(), -0.0012, 1.0e-12);
    BOOST_CHECK_EQUAL(b.metadata.label, "2Y");
    BOOST_CHECK(swap->indices().count("EUR-EURIBOR-3M") == 1);
    BOOST_CHECK(swap->indices().count("EUR-EURIBOR-6M") == 1);

    CurveNode oisNode("BASIS_SWAP/BASIS_SPREAD/ESTR/6M/EUR/2Y", BasisSwapNode("EUR-ESTR-6M-BASIS", 2 * Years));
    BuiltInstrument o = builder->build(oisNode, asof, quotes, CurveValueType::ZeroRate);
    auto oisSwap = QuantLib::ext::dynamic_pointer_cast<InterestRateSwap>(o.instrument);
    BOOST_REQUIRE(oisSwap);
    BOOST_CHECK(oisSwap->quotedLeg().type() == SwapLeg::Type::Overnight);
    BOOST_CHECK_EQUAL(oisSwap->quotedLeg().periods().size(), 8);
    BOOST_CHECK(oisSwap->otherLeg().type() == SwapLeg::Type::Ibor);
}

BOOST_FIXTURE_TEST_CASE(testFutureNode, BuilderData) {

    BOOST_TEST_MESSAGE("Testing future node...");

    CurveNode node("MM_FUTURE/PRICE/EUR/2026-09/3M", IborFutureNode("EUR-EURIBOR-3M-FUTURE", 2026, September));
    BuiltInstrument b = builder->build(node, asof, quotes, CurveValueType::ZeroRate);
    auto future = QuantLib::ext::dynamic_pointer_cast<IborFuture>(b.instrument);
    BOOST_REQUIRE(future);
    BOOST_CHECK_EQUAL(future->index(), "EUR-EURIBOR-3M");
    // third Wednesday of September
    BOOST_CHECK_EQUAL(future->startDate(), Date(16, September, 2026));
    BOOST_CHECK_EQUAL(future->lastTradeDate(), Date(14, September, 2026));
    BOOST_CHECK_EQUAL(future->endDate(), Date(16, December, 2026));
    // price in percent
    BOOST_CHECK_CLOSE(future->fixedRate(), 0.9785, 1.0e-10);
    BOOST_CHECK_CLOSE(future->quoteScale(), 0.01, 1.0e-12);
    BOOST_CHECK_EQUAL(b.metadata.label, "Sep26");
    BOOST_CHECK_EQUAL(b.nodeDate, Date(16, December, 2026));
    // implied rate as guess
    BOOST_CHECK_CLOSE(b.initialGuess, 0.0215, 1.0e-8);

    // a future whose reference date is not after the valuation date can not be calibrated
    CurveNode expired("MM_FUTURE/PRICE/EUR/2026-09/3M", IborFutureNode("EUR-EURIBOR-3M-FUTURE", 2026, June));
    BOOST_CHECK_THROW(builder->build(expired, asof, quotes, CurveValueType::ZeroRate), InvalidCurveNodeError);
}

BOOST_FIXTURE_TEST_CASE(testErrors, BuilderData) {

    BOOST_TEST_MESSAGE("Testing curve node errors...");

    // missing quote
    CurveNode missing("IR_SWAP/RATE/EUR/2D/1D/30Y", FixedFloatSwapNode("EUR-ESTR-OIS", 30 * Years));
    BOOST_CHECK_THROW(builder->build(missing, asof, quotes, CurveValueType::ZeroRate), MissingMarketDataError);
    try {
        builder->build(missing, asof, quotes, CurveValueType::ZeroRate);
    } catch (const MissingMarketDataError& e) {
        BOOST_CHECK_EQUAL(e.quoteId(), "IR_SWAP/RATE/EUR/2D/1D/30Y");
        BOOST_CHECK(e.kind() == CalibrationError::Kind::MissingMarketData);
    }
    // the node date does not need the quote
    BOOST_CHECK_NO_THROW(builder->nodeDate(missing, asof));

    // unknown convention
    CurveNode unknown("FRA/RATE/EUR/6M/6M", FraNode("EUR-1M-FRA", 6 * Months));
    BOOST_CHECK_THROW(builder->build(unknown, asof, quotes, CurveValueType::ZeroRate), InvalidCurveNodeError);

    // convention of the wrong type
    CurveNode wrongType("MM/RATE/EUR/0D/1D", TermDepositNode("EUR-6M-FRA", 1 * Days));
    BOOST_CHECK_THROW(builder->build(wrongType, asof, quotes, CurveValueType::ZeroRate), InvalidCurveNodeError);

    // a term deposit has no fixing
    CurveNode noFixing("MM/RATE/EUR/0D/1D", TermDepositNode("EUR-ON-DEPOSIT", 1 * Days), 0.0, "",
                       NodeDate::lastFixing());
    BOOST_CHECK_THROW(builder->build(noFixing, asof, quotes, CurveValueType::ZeroRate), InvalidCurveNodeError);

    // a fixed node date is used as given
    CurveNode fixed("MM/RATE/EUR/0D/1D", TermDepositNode("EUR-ON-DEPOSIT", 1 * Days), 0.0, "",
                    NodeDate::fixed(Date(3, July, 2026)));
    BOOST_CHECK_EQUAL(builder->build(fixed, asof, quotes, CurveValueType::ZeroRate).nodeDate, Date(3, July, 2026));

    BOOST_CHECK_THROW(builder->build(fixed, Date(), quotes, CurveValueType::ZeroRate), QuantLib::Error);
    BOOST_CHECK_THROW(CalibrationInstrumentBuilder(nullptr), QuantLib::Error);
}

BOOST_FIXTURE_TEST_CASE(testInstrumentForRate, BuilderData) {

    BOOST_TEST_MESSAGE("Testing instruments for a given rate...");

    auto swap = builder->instrument(FixedFloatSwapNode("EUR-ESTR-OIS", 2 * Years), asof, 0.03);
    BOOST_REQUIRE(swap);
    BOOST_CHECK_CLOSE(swap->fixedRate(), 0.03, 1.0e-12);
    BOOST_CHECK_THROW(builder->instrument(FraNode("EUR-1M-FRA", 1 * Months), asof, 0.03), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

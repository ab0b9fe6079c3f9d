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

#include "toplevelfixture.hpp"
#include <boost/test/unit_test.hpp>

#include <cve/termstructures/interpolatedparametercurve.hpp>
#include <cve/termstructures/ratescurveprovider.hpp>

#include <ql/time/daycounters/actual365fixed.hpp>

#include <cmath>

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace CurveExt;

namespace {

struct CurveData {
    CurveData() : asof(30, June, 2026) {
        for (Size i : {1, 2, 5, 10})
            nodeDates.push_back(asof + Period(static_cast<Integer>(i), Years));
    }
    InterpolatedParameterCurve curve(CurveValueType type, Interpolator interpolator,
                                     Extrapolator right = Extrapolator::Flat) const {
        std::vector<Real> rates = {0.010, 0.015, 0.020, 0.025};
        Array p(rates.size());
        for (Size i = 0; i < rates.size(); ++i) {
            Time t = Actual365Fixed().yearFraction(asof, nodeDates[i]);
            switch (type) {
            case CurveValueType::ZeroRate:
                p[i] = rates[i];
                break;
            case CurveValueType::DiscountFactor:
                p[i] = std::exp(-rates[i] * t);
                break;
            case CurveValueType::LogDiscountFactor:
                p[i] = -rates[i] * t;
                break;
            }
        }
        return InterpolatedParameterCurve("EUR-TEST", "EUR", asof, Actual365Fixed(), type, interpolator,
                                          Extrapolator::Flat, right, nodeDates, p);
    }
    Date asof;
    std::vector<Date> nodeDates;
};

// central difference of the discount factor at d w.r.t. parameter i
Real bumpedDiscountFactorDerivative(const InterpolatedParameterCurve& c, const Date& d, Size i) {
    Real h = 1.0e-6;
    Real p = c.parameters()[i];
    return (c.withParameter(i, p + h).discountFactor(d) - c.withParameter(i, p - h).discountFactor(d)) / (2.0 * h);
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(CurveExtTestSuite, CurveExt::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(InterpolatedParameterCurveTest)

BOOST_AUTO_TEST_CASE(testValuesAtNodes) {

    BOOST_TEST_MESSAGE("Testing interpolated parameter curve values at the nodes...");

    CurveData data;
    std::vector<Real> rates = {0.010, 0.015, 0.020, 0.025};
    for (auto type : {CurveValueType::ZeroRate, CurveValueType::DiscountFactor, CurveValueType::LogDiscountFactor}) {
        InterpolatedParameterCurve c = data.curve(type, Interpolator::Linear);
        BOOST_CHECK_CLOSE(c.discountFactor(data.asof), 1.0, 1.0e-12);
        for (Size i = 0; i < data.nodeDates.size(); ++i) {
            BOOST_CHECK_CLOSE(c.zeroRate(data.nodeDates[i]), rates[i], 1.0e-8);
            BOOST_CHECK_CLOSE(c.value(data.nodeDates[i]), c.parameters()[i], 1.0e-10);
        }
        BOOST_CHECK_EQUAL(c.parameterMetadata().size(), 4);
        BOOST_CHECK_EQUAL(c.parameterMetadata()[0].date, data.nodeDates[0]);
    }
}

BOOST_AUTO_TEST_CASE(testLogLinearDiscountFactors) {

    BOOST_TEST_MESSAGE("Testing log linear interpolation of discount factors...");

    CurveData data;
    InterpolatedParameterCurve c = data.curve(CurveValueType::DiscountFactor, Interpolator::LogLinear);
    InterpolatedParameterCurve l = data.curve(CurveValueType::LogDiscountFactor, Interpolator::Linear);

    // log linear discount factors and linear log discount factors describe the same curve
    for (Size m = 1; m < 150; m += 7) {
        Date d = data.asof + Period(static_cast<Integer>(m), Months);
        BOOST_CHECK_CLOSE(c.discountFactor(d), l.discountFactor(d), 1.0e-10);
    }

    // log interpolation is restricted to discount factors
    BOOST_CHECK_THROW(data.curve(CurveValueType::ZeroRate, Interpolator::LogLinear), QuantLib::Error);
    BOOST_CHECK_THROW(data.curve(CurveValueType::LogDiscountFactor, Interpolator::LogNaturalCubic), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testDiscountFactorSensitivityAgainstBump) {

    BOOST_TEST_MESSAGE("Testing analytic discount factor parameter sensitivities against finite differences...");

    CurveData data;
    std::vector<Interpolator> interpolators = {Interpolator::Linear, Interpolator::NaturalCubic};
    std::vector<Date> dates = {data.asof + 10, data.asof + Period(18, Months), data.asof + Period(7, Years),
                               data.asof + Period(12, Years)};

    for (auto type : {CurveValueType::ZeroRate, CurveValueType::DiscountFactor, CurveValueType::LogDiscountFactor}) {
        for (auto interpolator : interpolators) {
            for (auto right : {Extrapolator::Flat, Extrapolator::Linear}) {
                InterpolatedParameterCurve c = data.curve(type, interpolator, right);
                for (auto const& d : dates) {
                    Array analytic = c.discountFactorParameterSensitivity(d);
                    BOOST_REQUIRE_EQUAL(analytic.size(), c.parameterCount());
                    for (Size i = 0; i < c.parameterCount(); ++i) {
                        Real fd = bumpedDiscountFactorDerivative(c, d, i);
                        BOOST_CHECK_MESSAGE(std::fabs(analytic[i] - fd) < 1.0e-7,
                                            "type " << type << ", interpolator " << interpolator << ", date "
                                                    << io::iso_date(d) << ", parameter " << i << ": analytic "
                                                    << analytic[i] << ", finite difference " << fd);
                    }
                }
            }
        }
    }

    // log interpolated discount factors
    for (auto interpolator : {Interpolator::LogLinear, Interpolator::LogNaturalCubic}) {
        for (auto right : {Extrapolator::Flat, Extrapolator::Linear}) {
            InterpolatedParameterCurve c = data.curve(CurveValueType::DiscountFactor, interpolator, right);
            for (auto const& d : dates) {
                Array analytic = c.discountFactorParameterSensitivity(d);
                BOOST_REQUIRE_EQUAL(analytic.size(), c.parameterCount());
                for (Size i = 0; i < c.parameterCount(); ++i) {
                    Real fd = bumpedDiscountFactorDerivative(c, d, i);
                    BOOST_CHECK_MESSAGE(std::fabs(analytic[i] - fd) < 1.0e-7,
                                        "interpolator " << interpolator << ", right extrapolator " << right
                                                        << ", date " << io::iso_date(d) << ", parameter " << i
                                                        << ": analytic " << analytic[i] << ", finite difference "
                                                        << fd);
                }
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(testFunctionalUpdates) {

    BOOST_TEST_MESSAGE("Testing that parameter updates return new curves...");

    CurveData data;
    InterpolatedParameterCurve c = data.curve(CurveValueType::ZeroRate, Interpolator::Linear);
    InterpolatedParameterCurve d = c.withParameter(2, 0.03);
    BOOST_CHECK_CLOSE(c.parameters()[2], 0.02, 1.0e-12);
    BOOST_CHECK_CLOSE(d.parameters()[2], 0.03, 1.0e-12);
    BOOST_CHECK_EQUAL(d.name(), c.name());
    BOOST_CHECK_THROW(c.withParameter(4, 0.01), QuantLib::Error);
    BOOST_CHECK_THROW(c.withParameters(Array(3, 0.01)), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testInvalidCurves) {

    BOOST_TEST_MESSAGE("Testing interpolated parameter curve construction errors...");

    CurveData data;
    std::vector<Date> dates = {data.asof, data.asof + Period(1, Years)};
    // discount factor curves are anchored at the reference date, a node there is not allowed
    BOOST_CHECK_THROW(InterpolatedParameterCurve("C", "EUR", data.asof, Actual365Fixed(),
                                                 CurveValueType::DiscountFactor, Interpolator::Linear,
                                                 Extrapolator::Flat, Extrapolator::Flat, dates, Array(2, 1.0)),
                      QuantLib::Error);
    BOOST_CHECK_THROW(InterpolatedParameterCurve("C", "EUR", data.asof, Actual365Fixed(), CurveValueType::ZeroRate,
                                                 Interpolator::Linear, Extrapolator::Flat, Extrapolator::Flat, dates,
                                                 Array(3, 0.01)),
                      QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testRatesCurveProvider) {

    BOOST_TEST_MESSAGE("Testing rates curve provider lookups...");

    CurveData data;
    InterpolatedParameterCurve c = data.curve(CurveValueType::ZeroRate, Interpolator::Linear);
    RatesCurveProvider provider(data.asof);
    provider.addCurve(c, {"EUR"}, {"EUR-ESTR"});

    BOOST_CHECK(provider.hasCurve("EUR-TEST"));
    BOOST_CHECK_EQUAL(provider.discountCurve("EUR").name(), "EUR-TEST");
    BOOST_CHECK_EQUAL(provider.indexCurve("EUR-ESTR").name(), "EUR-TEST");
    BOOST_CHECK(!provider.indexCurveName("EUR-EURIBOR-6M"));
    BOOST_CHECK_THROW(provider.discountCurve("USD"), QuantLib::Error);
    BOOST_CHECK_THROW(provider.addCurve(c, {}, {}), QuantLib::Error);

    // replacing a curve leaves the original provider unchanged
    RatesCurveProvider bumped = provider.withCurves({c.withParameter(0, 0.05)});
    BOOST_CHECK_CLOSE(bumped.curve("EUR-TEST").parameters()[0], 0.05, 1.0e-12);
    BOOST_CHECK_CLOSE(provider.curve("EUR-TEST").parameters()[0], 0.01, 1.0e-12);

    InterpolatedParameterCurve other("OTHER", "EUR", data.asof, Actual365Fixed(), CurveValueType::ZeroRate,
                                     Interpolator::Linear, Extrapolator::Flat, Extrapolator::Flat, data.nodeDates,
                                     Array(4, 0.01));
    BOOST_CHECK_THROW(provider.withCurves({other}), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

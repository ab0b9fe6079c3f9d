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

#include <cred/configuration/calibrationconfig.hpp>

using namespace std;
using namespace boost::unit_test_framework;
using namespace QuantLib;
using namespace cre::data;

BOOST_FIXTURE_TEST_SUITE(CREDataTestSuite, cre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(CalibrationConfigTests)

BOOST_AUTO_TEST_CASE(testDefaults) {

    BOOST_TEST_MESSAGE("Testing calibration config defaults...");

    CalibrationConfig config;
    config.fromXMLString("<CalibrationConfig/>");
    BOOST_CHECK_EQUAL(config.tolerance(), 1.0e-12);
    BOOST_CHECK_EQUAL(config.maxIterations(), 100);
    BOOST_CHECK_EQUAL(config.maxConditionNumber(), 1.0e12);
    BOOST_CHECK_EQUAL(config.maxStepHalvings(), 10);
    BOOST_CHECK(config.measure() == CurveExt::CalibrationMeasure::ParSpread);
}

BOOST_AUTO_TEST_CASE(testFromXml) {

    BOOST_TEST_MESSAGE("Testing calibration config from xml...");

    CalibrationConfig config;
    config.fromXMLString("<CalibrationConfig><Tolerance>1e-10</Tolerance><MaxIterations>25</MaxIterations>"
                         "<MaxStepHalvings>0</MaxStepHalvings><Measure>PV</Measure></CalibrationConfig>");
    BOOST_CHECK_CLOSE(config.tolerance(), 1.0e-10, 1.0e-12);
    BOOST_CHECK_EQUAL(config.maxIterations(), 25);
    BOOST_CHECK_EQUAL(config.maxStepHalvings(), 0);
    BOOST_CHECK(config.measure() == CurveExt::CalibrationMeasure::PresentValue);

    CalibrationConfig copy;
    copy.fromXMLString(config.toXMLString());
    BOOST_CHECK_EQUAL(copy.tolerance(), config.tolerance());
    BOOST_CHECK_EQUAL(copy.maxIterations(), config.maxIterations());
    BOOST_CHECK(copy.measure() == config.measure());

    BOOST_CHECK_THROW(config.fromXMLString("<CalibrationConfig><Tolerance>0</Tolerance></CalibrationConfig>"),
                      QuantLib::Error);
    BOOST_CHECK_THROW(config.fromXMLString("<CalibrationConfig><MaxIterations>0</MaxIterations></CalibrationConfig>"),
                      QuantLib::Error);
    BOOST_CHECK_THROW(
        config.fromXMLString("<CalibrationConfig><MaxConditionNumber>0.5</MaxConditionNumber></CalibrationConfig>"),
        QuantLib::Error);
    BOOST_CHECK_THROW(config.fromXMLString("<CalibrationConfig><Measure>Yield</Measure></CalibrationConfig>"),
                      QuantLib::Error);
    BOOST_CHECK_THROW(CalibrationConfig(-1.0), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

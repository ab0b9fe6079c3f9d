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

#include <cred/configuration/calibrationconfig.hpp>
#include <cred/utilities/parsers.hpp>
#include <cred/utilities/to_string.hpp>

using namespace QuantLib;

namespace cre {
namespace data {

CalibrationConfig::CalibrationConfig(Real tolerance, Size maxIterations, Real maxConditionNumber,
                                     Size maxStepHalvings, CurveExt::CalibrationMeasure measure)
    : tolerance_(tolerance), maxIterations_(maxIterations), maxConditionNumber_(maxConditionNumber),
      maxStepHalvings_(maxStepHalvings), measure_(measure) {
    QL_REQUIRE(tolerance_ > 0.0, "Tolerance (" << tolerance_ << ") must be a positive number");
    QL_REQUIRE(maxIterations_ > 0, "MaxIterations must be a positive integer");
}

void CalibrationConfig::fromXML(XMLNode* node) {

    XMLUtils::checkNode(node, "CalibrationConfig");

    tolerance_ = 1e-12;
    if (XMLNode* n = XMLUtils::getChildNode(node, "Tolerance")) {
        tolerance_ = parseReal(XMLUtils::getNodeValue(n));
        QL_REQUIRE(tolerance_ > 0, "Tolerance (" << tolerance_ << ") must be a positive number");
    }

    maxIterations_ = 100;
    if (XMLNode* n = XMLUtils::getChildNode(node, "MaxIterations")) {
        Integer maxIterations = parseInteger(XMLUtils::getNodeValue(n));
        QL_REQUIRE(maxIterations > 0, "MaxIterations (" << maxIterations << ") must be a positive integer");
        maxIterations_ = static_cast<Size>(maxIterations);
    }

    maxConditionNumber_ = 1e12;
    if (XMLNode* n = XMLUtils::getChildNode(node, "MaxConditionNumber")) {
        maxConditionNumber_ = parseReal(XMLUtils::getNodeValue(n));
        QL_REQUIRE(maxConditionNumber_ >= 1.0,
                   "MaxConditionNumber (" << maxConditionNumber_ << ") must be greater or equal to 1");
    }

    maxStepHalvings_ = 10;
    if (XMLNode* n = XMLUtils::getChildNode(node, "MaxStepHalvings")) {
        Integer maxStepHalvings = parseInteger(XMLUtils::getNodeValue(n));
        QL_REQUIRE(maxStepHalvings >= 0, "MaxStepHalvings (" << maxStepHalvings << ") must not be negative");
        maxStepHalvings_ = static_cast<Size>(maxStepHalvings);
    }

    measure_ = CurveExt::CalibrationMeasure::ParSpread;
    if (XMLNode* n = XMLUtils::getChildNode(node, "Measure")) {
        measure_ = parseCalibrationMeasure(XMLUtils::getNodeValue(n));
    }
}

XMLNode* CalibrationConfig::toXML(XMLDocument& doc) const {

    XMLNode* node = doc.allocNode("CalibrationConfig");
    XMLUtils::addChild(doc, node, "Tolerance", tolerance_);
    XMLUtils::addChild(doc, node, "MaxIterations", static_cast<int>(maxIterations_));
    XMLUtils::addChild(doc, node, "MaxConditionNumber", maxConditionNumber_);
    XMLUtils::addChild(doc, node, "MaxStepHalvings", static_cast<int>(maxStepHalvings_));
    XMLUtils::addChild(doc, node, "Measure", to_string(measure_));

    return node;
}

} // namespace data
} // namespace cre

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

#include <cred/portfolio/trade.hpp>
#include <cred/utilities/log.hpp>
#include <cred/utilities/to_string.hpp>

#include <ql/errors.hpp>

using namespace CurveExt;

namespace cre {
namespace data {

Trade::Trade(const string& id, const CurveNodeInstrument& instrument, Real rate, Real notional)
    : id_(id), instrument_(instrument), rate_(rate), notional_(notional) {
    QL_REQUIRE(!id_.empty(), "Trade: empty trade id");
}

string Trade::tradeType() const { return curveNodeInstrumentType(instrument_); }

void Trade::build(const CalibrationInstrumentBuilder& builder, const Date& valuationDate) {
    DLOG("Build trade " << id_ << " for " << to_string(valuationDate));
    // futures are quoted as prices in percent
    Real rate = boost::get<IborFutureNode>(&instrument_) != nullptr ? rate_ / 100.0 : rate_;
    calibrationInstrument_ = builder.instrument(instrument_, valuationDate, rate);
}

const QuantLib::ext::shared_ptr<CalibrationInstrument>& Trade::calibrationInstrument() const {
    QL_REQUIRE(calibrationInstrument_, "Trade " << id_ << " is not built");
    return calibrationInstrument_;
}

InstrumentValue Trade::presentValue(const RatesCurveProvider& provider) const {
    InstrumentValue v = calibrationInstrument()->presentValue(provider);
    return InstrumentValue(notional_ * v.value, v.sensitivities.multipliedBy(notional_));
}

void Trade::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "Trade");
    id_ = XMLUtils::getAttribute(node, "id");
    QL_REQUIRE(!id_.empty(), "Trade: attribute id missing");

    XMLNode* instrumentNode = nullptr;
    for (XMLNode* child = XMLUtils::getChildNode(node); child; child = XMLUtils::getNextSibling(child)) {
        string name = XMLUtils::getNodeName(child);
        if (name == "Rate" || name == "Notional")
            continue;
        QL_REQUIRE(instrumentNode == nullptr, "Trade " << id_ << " has more than one instrument");
        instrumentNode = child;
    }
    QL_REQUIRE(instrumentNode, "Trade " << id_ << " has no instrument");
    instrument_ = curveNodeInstrumentFromXML(instrumentNode);
    rate_ = XMLUtils::getChildValueAsDouble(node, "Rate", true);
    notional_ = XMLUtils::getChildValueAsDouble(node, "Notional", false, 1.0);
    calibrationInstrument_.reset();
}

XMLNode* Trade::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("Trade");
    XMLUtils::addAttribute(doc, node, "id", id_);
    XMLUtils::appendNode(node, curveNodeInstrumentToXML(doc, instrument_));
    XMLUtils::addChild(doc, node, "Rate", rate_);
    XMLUtils::addChild(doc, node, "Notional", notional_);
    return node;
}

} // namespace data
} // namespace cre

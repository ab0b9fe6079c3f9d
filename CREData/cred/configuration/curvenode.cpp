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

#include <cred/configuration/curvenode.hpp>
#include <cred/utilities/parsers.hpp>
#include <cred/utilities/to_string.hpp>

#include <ql/errors.hpp>

using namespace QuantLib;

namespace cre {
namespace data {

namespace {

class ConventionIdVisitor : public boost::static_visitor<const string&> {
public:
    template <class T> const string& operator()(const T& n) const { return n.convention; }
};

class TypeVisitor : public boost::static_visitor<string> {
public:
    string operator()(const TermDepositNode&) const { return "Deposit"; }
    string operator()(const IborFixingDepositNode&) const { return "IborFixingDeposit"; }
    string operator()(const FraNode&) const { return "FRA"; }
    string operator()(const FixedFloatSwapNode&) const { return "Swap"; }
    string operator()(const BasisSwapNode&) const { return "BasisSwap"; }
    string operator()(const IborFutureNode&) const { return "Future"; }
};

class ToXMLVisitor : public boost::static_visitor<XMLNode*> {
public:
    explicit ToXMLVisitor(XMLDocument& doc) : doc_(doc) {}

    XMLNode* operator()(const TermDepositNode& n) const {
        XMLNode* node = doc_.allocNode("Deposit");
        XMLUtils::addChild(doc_, node, "Convention", n.convention);
        XMLUtils::addChild(doc_, node, "Tenor", n.tenor);
        return node;
    }
    XMLNode* operator()(const IborFixingDepositNode& n) const {
        XMLNode* node = doc_.allocNode("IborFixingDeposit");
        XMLUtils::addChild(doc_, node, "Convention", n.convention);
        return node;
    }
    XMLNode* operator()(const FraNode& n) const {
        XMLNode* node = doc_.allocNode("FRA");
        XMLUtils::addChild(doc_, node, "Convention", n.convention);
        XMLUtils::addChild(doc_, node, "PeriodToStart", n.periodToStart);
        return node;
    }
    XMLNode* operator()(const FixedFloatSwapNode& n) const {
        XMLNode* node = doc_.allocNode("Swap");
        XMLUtils::addChild(doc_, node, "Convention", n.convention);
        XMLUtils::addChild(doc_, node, "Tenor", n.tenor);
        if (n.forwardStart.length() != 0)
            XMLUtils::addChild(doc_, node, "ForwardStart", n.forwardStart);
        return node;
    }
    XMLNode* operator()(const BasisSwapNode& n) const {
        XMLNode* node = doc_.allocNode("BasisSwap");
        XMLUtils::addChild(doc_, node, "Convention", n.convention);
        XMLUtils::addChild(doc_, node, "Tenor", n.tenor);
        return node;
    }
    XMLNode* operator()(const IborFutureNode& n) const {
        XMLNode* node = doc_.allocNode("Future");
        XMLUtils::addChild(doc_, node, "Convention", n.convention);
        XMLUtils::addChild(doc_, node, "Year", static_cast<int>(n.year));
        XMLUtils::addChild(doc_, node, "Month", static_cast<int>(n.month));
        return node;
    }

private:
    XMLDocument& doc_;
};

} // namespace

CurveNodeInstrument curveNodeInstrumentFromXML(XMLNode* node) {
    string type = XMLUtils::getNodeName(node);
    string convention = XMLUtils::getChildValue(node, "Convention", true);
    if (type == "Deposit") {
        return TermDepositNode(convention, parsePeriod(XMLUtils::getChildValue(node, "Tenor", true)));
    } else if (type == "IborFixingDeposit") {
        return IborFixingDepositNode(convention);
    } else if (type == "FRA") {
        return FraNode(convention, parsePeriod(XMLUtils::getChildValue(node, "PeriodToStart", true)));
    } else if (type == "Swap") {
        Period forwardStart = parsePeriod(XMLUtils::getChildValue(node, "ForwardStart", false, "0D"));
        return FixedFloatSwapNode(convention, parsePeriod(XMLUtils::getChildValue(node, "Tenor", true)),
                                  forwardStart);
    } else if (type == "BasisSwap") {
        return BasisSwapNode(convention, parsePeriod(XMLUtils::getChildValue(node, "Tenor", true)));
    } else if (type == "Future") {
        int year = XMLUtils::getChildValueAsInt(node, "Year", true);
        QL_REQUIRE(year >= 1901 && year <= 2199, "Future node: year " << year << " out of range");
        return IborFutureNode(convention, static_cast<Year>(year),
                              parseMonth(XMLUtils::getChildValue(node, "Month", true)));
    }
    QL_FAIL("Curve node instrument type '" << type << "' not recognized");
}

string curveNodeInstrumentType(const CurveNodeInstrument& instrument) {
    return boost::apply_visitor(TypeVisitor(), instrument);
}

XMLNode* curveNodeInstrumentToXML(XMLDocument& doc, const CurveNodeInstrument& instrument) {
    return boost::apply_visitor(ToXMLVisitor(doc), instrument);
}

NodeDate::NodeDate(Type type, const Date& date) : type_(type), date_(date) {
    QL_REQUIRE(type_ != Type::Fixed || date_ != Date(), "NodeDate: a fixed node date requires a date");
}

bool operator==(const NodeDate& a, const NodeDate& b) { return a.type() == b.type() && a.date() == b.date(); }

std::ostream& operator<<(std::ostream& out, const NodeDate& d) {
    switch (d.type()) {
    case NodeDate::Type::End:
        return out << "End";
    case NodeDate::Type::LastFixing:
        return out << "LastFixing";
    case NodeDate::Type::Fixed:
        return out << to_string(d.date());
    }
    QL_FAIL("unknown node date type");
}

NodeDate parseNodeDate(const string& s) {
    if (s.empty() || s == "End")
        return NodeDate::end();
    if (s == "LastFixing")
        return NodeDate::lastFixing();
    return NodeDate::fixed(parseDate(s));
}

CurveNode::CurveNode(const string& quoteId, const CurveNodeInstrument& instrument, Real spread, const string& label,
                     const NodeDate& nodeDate)
    : quoteId_(quoteId), instrument_(instrument), spread_(spread), label_(label), nodeDate_(nodeDate) {
    QL_REQUIRE(!quoteId_.empty(), "CurveNode: empty quote id");
}

const string& CurveNode::conventionId() const { return boost::apply_visitor(ConventionIdVisitor(), instrument_); }

string CurveNode::instrumentType() const { return curveNodeInstrumentType(instrument_); }

void CurveNode::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "Node");
    quoteId_ = XMLUtils::getChildValue(node, "QuoteId", true);

    XMLNode* instrumentNode = nullptr;
    for (XMLNode* child = XMLUtils::getChildNode(node); child; child = XMLUtils::getNextSibling(child)) {
        string name = XMLUtils::getNodeName(child);
        if (name == "QuoteId" || name == "Spread" || name == "Label" || name == "NodeDate")
            continue;
        QL_REQUIRE(instrumentNode == nullptr, "Curve node " << quoteId_ << " has more than one instrument");
        instrumentNode = child;
    }
    QL_REQUIRE(instrumentNode, "Curve node " << quoteId_ << " has no instrument");
    instrument_ = curveNodeInstrumentFromXML(instrumentNode);

    spread_ = XMLUtils::getChildValueAsDouble(node, "Spread", false, 0.0);
    label_ = XMLUtils::getChildValue(node, "Label", false);
    nodeDate_ = parseNodeDate(XMLUtils::getChildValue(node, "NodeDate", false, "End"));
}

XMLNode* CurveNode::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("Node");
    XMLUtils::addChild(doc, node, "QuoteId", quoteId_);
    XMLUtils::appendNode(node, curveNodeInstrumentToXML(doc, instrument_));
    if (spread_ != 0.0)
        XMLUtils::addChild(doc, node, "Spread", spread_);
    if (!label_.empty())
        XMLUtils::addChild(doc, node, "Label", label_);
    XMLUtils::addChild(doc, node, "NodeDate", to_string(nodeDate_));
    return node;
}

} // namespace data
} // namespace cre

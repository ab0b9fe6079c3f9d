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

#include <cred/configuration/curvedefinition.hpp>
#include <cred/utilities/log.hpp>
#include <cred/utilities/parsers.hpp>
#include <cred/utilities/to_string.hpp>

#include <ql/errors.hpp>

using namespace QuantLib;

namespace cre {
namespace data {

CurveDefinition::CurveDefinition(const string& name, const string& currency, const vector<CurveNode>& nodes,
                                 CurveExt::CurveValueType valueType, CurveExt::Interpolator interpolator,
                                 CurveExt::Extrapolator leftExtrapolator, CurveExt::Extrapolator rightExtrapolator,
                                 const DayCounter& dayCounter)
    : name_(name), currency_(currency), nodes_(nodes), valueType_(valueType), interpolator_(interpolator),
      leftExtrapolator_(leftExtrapolator), rightExtrapolator_(rightExtrapolator), dayCounter_(dayCounter) {
    check();
}

void CurveDefinition::check() const {
    QL_REQUIRE(!name_.empty(), "CurveDefinition: empty curve name");
    QL_REQUIRE(!currency_.empty(), "CurveDefinition " << name_ << ": empty currency");
    QL_REQUIRE(!nodes_.empty(), "CurveDefinition " << name_ << ": no nodes given");
    QL_REQUIRE(!dayCounter_.empty(), "CurveDefinition " << name_ << ": no day counter given");
    QL_REQUIRE(!CurveExt::isLogInterpolator(interpolator_) ||
                   valueType_ == CurveExt::CurveValueType::DiscountFactor,
               "CurveDefinition " << name_ << ": interpolator " << interpolator_ << " requires discount factor values");
}

void CurveDefinition::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "CurveDefinition");
    name_ = XMLUtils::getChildValue(node, "Name", true);
    currency_ = XMLUtils::getChildValue(node, "Currency", true);
    valueType_ = parseCurveValueType(XMLUtils::getChildValue(node, "ValueType", true));
    interpolator_ = parseInterpolator(XMLUtils::getChildValue(node, "Interpolator", true));
    leftExtrapolator_ = parseExtrapolator(XMLUtils::getChildValue(node, "LeftExtrapolator", false, "Flat"));
    rightExtrapolator_ = parseExtrapolator(XMLUtils::getChildValue(node, "RightExtrapolator", false, "Flat"));
    dayCounter_ = parseDayCounter(XMLUtils::getChildValue(node, "DayCounter", false, "A365F"));

    nodes_.clear();
    XMLNode* nodesNode = XMLUtils::getChildNode(node, "Nodes");
    QL_REQUIRE(nodesNode, "CurveDefinition " << name_ << ": Nodes missing");
    for (XMLNode* child : XMLUtils::getChildrenNodes(nodesNode, "Node")) {
        CurveNode n;
        n.fromXML(child);
        nodes_.push_back(n);
    }
    DLOG("Loaded curve definition " << name_ << " with " << nodes_.size() << " nodes");
    check();
}

XMLNode* CurveDefinition::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("CurveDefinition");
    XMLUtils::addChild(doc, node, "Name", name_);
    XMLUtils::addChild(doc, node, "Currency", currency_);
    XMLUtils::addChild(doc, node, "ValueType", to_string(valueType_));
    XMLUtils::addChild(doc, node, "Interpolator", to_string(interpolator_));
    XMLUtils::addChild(doc, node, "LeftExtrapolator", to_string(leftExtrapolator_));
    XMLUtils::addChild(doc, node, "RightExtrapolator", to_string(rightExtrapolator_));
    XMLUtils::addChild(doc, node, "DayCounter", to_string(dayCounter_));
    XMLNode* nodesNode = XMLUtils::addChild(doc, node, "Nodes");
    for (auto const& n : nodes_)
        XMLUtils::appendNode(nodesNode, n.toXML(doc));
    return node;
}

CurveGroupDefinition::CurveGroupDefinition(const string& name, const vector<CurveDefinition>& curves,
                                           const vector<CurveGroupEntry>& entries)
    : name_(name), curves_(curves), entries_(entries) {
    check();
}

void CurveGroupDefinition::check() const {
    QL_REQUIRE(!name_.empty(), "CurveGroupDefinition: empty group name");
    QL_REQUIRE(!curves_.empty(), "CurveGroupDefinition " << name_ << ": no curves given");
    std::set<string> names, currencies, indices, entryNames;
    for (auto const& c : curves_)
        QL_REQUIRE(names.insert(c.name()).second,
                   "CurveGroupDefinition " << name_ << ": duplicate curve " << c.name());
    for (auto const& e : entries_) {
        QL_REQUIRE(names.count(e.curveName) > 0, "CurveGroupDefinition " << name_ << ": entry for curve "
                                                                         << e.curveName
                                                                         << " which is not defined in the group");
        QL_REQUIRE(entryNames.insert(e.curveName).second,
                   "CurveGroupDefinition " << name_ << ": more than one entry for curve " << e.curveName);
        for (auto const& ccy : e.discountCurrencies)
            QL_REQUIRE(currencies.insert(ccy).second,
                       "CurveGroupDefinition " << name_ << ": currency " << ccy << " discounted on two curves");
        for (auto const& i : e.indices)
            QL_REQUIRE(indices.insert(i).second,
                       "CurveGroupDefinition " << name_ << ": index " << i << " projected from two curves");
    }
}

bool CurveGroupDefinition::hasCurve(const string& curveName) const {
    for (auto const& c : curves_)
        if (c.name() == curveName)
            return true;
    return false;
}

const CurveDefinition& CurveGroupDefinition::curveDefinition(const string& curveName) const {
    for (auto const& c : curves_)
        if (c.name() == curveName)
            return c;
    QL_FAIL("CurveGroupDefinition " << name_ << ": curve " << curveName << " not found");
}

CurveGroupEntry CurveGroupDefinition::entry(const string& curveName) const {
    for (auto const& e : entries_)
        if (e.curveName == curveName)
            return e;
    return CurveGroupEntry(curveName, {}, {});
}

Size CurveGroupDefinition::parameterCount() const {
    Size n = 0;
    for (auto const& c : curves_)
        n += c.parameterCount();
    return n;
}

void CurveGroupDefinition::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "CurveGroup");
    name_ = XMLUtils::getChildValue(node, "Name", true);

    curves_.clear();
    XMLNode* curvesNode = XMLUtils::getChildNode(node, "CurveDefinitions");
    QL_REQUIRE(curvesNode, "CurveGroup " << name_ << ": CurveDefinitions missing");
    for (XMLNode* child : XMLUtils::getChildrenNodes(curvesNode, "CurveDefinition")) {
        CurveDefinition c;
        c.fromXML(child);
        curves_.push_back(c);
    }

    entries_.clear();
    if (XMLNode* entriesNode = XMLUtils::getChildNode(node, "Entries")) {
        for (XMLNode* child : XMLUtils::getChildrenNodes(entriesNode, "Entry")) {
            CurveGroupEntry e;
            e.curveName = XMLUtils::getChildValue(child, "CurveName", true);
            e.discountCurrencies = XMLUtils::getChildrenValues(child, "DiscountCurrencies", "Currency", false);
            e.indices = XMLUtils::getChildrenValues(child, "Indices", "Index", false);
            entries_.push_back(e);
        }
    }
    check();
}

XMLNode* CurveGroupDefinition::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("CurveGroup");
    XMLUtils::addChild(doc, node, "Name", name_);
    XMLNode* curvesNode = XMLUtils::addChild(doc, node, "CurveDefinitions");
    for (auto const& c : curves_)
        XMLUtils::appendNode(curvesNode, c.toXML(doc));
    XMLNode* entriesNode = XMLUtils::addChild(doc, node, "Entries");
    for (auto const& e : entries_) {
        XMLNode* entryNode = XMLUtils::addChild(doc, entriesNode, "Entry");
        XMLUtils::addChild(doc, entryNode, "CurveName", e.curveName);
        XMLUtils::addChildren(doc, entryNode, "DiscountCurrencies", "Currency", e.discountCurrencies);
        XMLUtils::addChildren(doc, entryNode, "Indices", "Index", e.indices);
    }
    return node;
}

const CurveGroupDefinition& CurveGroupDefinitions::get(const string& name) const {
    auto it = groups_.find(name);
    QL_REQUIRE(it != groups_.end(), "CurveGroupDefinitions: group " << name << " not found");
    return it->second;
}

void CurveGroupDefinitions::add(const CurveGroupDefinition& group) {
    if (groups_.count(group.name()) > 0)
        WLOG("Overwriting curve group " << group.name());
    groups_[group.name()] = group;
}

vector<string> CurveGroupDefinitions::names() const {
    vector<string> result;
    for (auto const& g : groups_)
        result.push_back(g.first);
    return result;
}

void CurveGroupDefinitions::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "CurveGroups");
    groups_.clear();
    for (XMLNode* child : XMLUtils::getChildrenNodes(node, "CurveGroup")) {
        CurveGroupDefinition g;
        g.fromXML(child);
        LOG("Loaded curve group " << g.name() << " with " << g.curveDefinitions().size() << " curves");
        add(g);
    }
}

XMLNode* CurveGroupDefinitions::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("CurveGroups");
    for (auto const& g : groups_)
        XMLUtils::appendNode(node, g.second.toXML(doc));
    return node;
}

} // namespace data
} // namespace cre

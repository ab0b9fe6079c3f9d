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

#include <crea/app/parameters.hpp>

#include <cred/utilities/log.hpp>
#include <cred/utilities/parsers.hpp>

#include <ql/errors.hpp>

#include <algorithm>
#include <utility>
#include <vector>

namespace cre {
namespace analytics {

namespace {
// the fixed groups and their xml node names
const std::vector<std::pair<string, string>> fixedGroups = {
    {"setup", "Setup"}, {"logging", "Logging"}, {"markets", "Markets"}};

map<string, string> readGroup(XMLNode* node) {
    map<string, string> result;
    for (XMLNode* child = XMLUtils::getChildNode(node); child; child = XMLUtils::getNextSibling(child)) {
        string key = XMLUtils::getAttribute(child, "name");
        QL_REQUIRE(!key.empty(), "parameter without name in group " << XMLUtils::getNodeName(node));
        result[key] = XMLUtils::getNodeValue(child);
    }
    return result;
}

void writeGroup(XMLDocument& doc, XMLNode* node, const map<string, string>& group) {
    for (auto const& p : group) {
        XMLNode* child = doc.allocNode("Parameter", p.second);
        XMLUtils::addAttribute(doc, child, "name", p.first);
        XMLUtils::appendNode(node, child);
    }
}
} // namespace

bool Parameters::hasGroup(const string& groupName) const { return (data_.find(groupName) != data_.end()); }

bool Parameters::has(const string& groupName, const string& paramName) const {
    QL_REQUIRE(hasGroup(groupName), "param group '" << groupName << "' not found");
    auto it = data_.find(groupName);
    return (it->second.find(paramName) != it->second.end());
}

string Parameters::get(const string& groupName, const string& paramName, bool fail) const {
    if (fail) {
        QL_REQUIRE(has(groupName, paramName), "parameter " << paramName << " not found in param group " << groupName);
        auto it = data_.find(groupName);
        return it->second.find(paramName)->second;
    } else {
        if (!hasGroup(groupName) || !has(groupName, paramName))
            return "";
        else {
            auto it = data_.find(groupName);
            return it->second.find(paramName)->second;
        }
    }
}

const map<string, string>& Parameters::data(const string& groupName) const {
    auto it = data_.find(groupName);
    QL_REQUIRE(it != data_.end(), "param group '" << groupName << "' not found");
    return it->second;
}

const map<string, string>& Parameters::markets() const { return data("markets"); }

bool Parameters::isActive(const string& analytic) const {
    string active = get(analytic, "active", false);
    return !active.empty() && parseBool(active);
}

void Parameters::fromFile(const string& fileName) {
    LOG("load CRE configuration from " << fileName);
    clear();
    XMLDocument doc(fileName);
    fromXML(doc.getFirstNode("CRE"));
    LOG("load CRE configuration from " << fileName << " done.");
}

void Parameters::clear() { data_.clear(); }

void Parameters::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "CRE");

    XMLNode* setupNode = XMLUtils::getChildNode(node, "Setup");
    QL_REQUIRE(setupNode, "node Setup not found in parameter file");
    for (auto const& g : fixedGroups) {
        XMLNode* groupNode = XMLUtils::getChildNode(node, g.second);
        if (groupNode)
            data_[g.first] = readGroup(groupNode);
    }

    XMLNode* analyticsNode = XMLUtils::getChildNode(node, "Analytics");
    if (analyticsNode) {
        for (XMLNode* child = XMLUtils::getChildNode(analyticsNode); child; child = XMLUtils::getNextSibling(child)) {
            string groupName = XMLUtils::getAttribute(child, "type");
            QL_REQUIRE(!groupName.empty(), "Analytic without type in parameter file");
            QL_REQUIRE(data_.find(groupName) == data_.end(), "param group '" << groupName << "' given twice");
            data_[groupName] = readGroup(child);
        }
    }
}

XMLNode* Parameters::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("CRE");
    for (auto const& g : fixedGroups) {
        auto it = data_.find(g.first);
        if (it != data_.end())
            writeGroup(doc, XMLUtils::addChild(doc, node, g.second), it->second);
    }
    XMLNode* analyticsNode = nullptr;
    for (auto const& d : data_) {
        if (std::find_if(fixedGroups.begin(), fixedGroups.end(),
                         [&d](const std::pair<string, string>& g) { return g.first == d.first; }) != fixedGroups.end())
            continue;
        if (!analyticsNode)
            analyticsNode = XMLUtils::addChild(doc, node, "Analytics");
        XMLNode* analyticNode = XMLUtils::addChild(doc, analyticsNode, "Analytic");
        XMLUtils::addAttribute(doc, analyticNode, "type", d.first);
        writeGroup(doc, analyticNode, d.second);
    }
    return node;
}

void Parameters::log() const {
    LOG("Parameters:");
    for (auto const& p : data_)
        for (auto const& pp : p.second)
            LOG("group = " << p.first << " : " << pp.first << " = " << pp.second);
}

} // namespace analytics
} // namespace cre

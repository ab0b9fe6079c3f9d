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

/*! \file cred/utilities/xmlutils.cpp
    \brief XML utility functions
    \ingroup utilities
*/

#include <cred/utilities/parsers.hpp>
#include <cred/utilities/to_string.hpp>
#include <cred/utilities/xmlutils.hpp>

#include <ql/errors.hpp>

#include <rapidxml.hpp>

#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>

using namespace std;
using namespace rapidxml;
using QuantLib::Size;

namespace cre {
namespace data {

namespace {

string escape(const char* s, Size n) {
    string r(s, n);
    boost::replace_all(r, "&", "&amp;");
    boost::replace_all(r, "<", "&lt;");
    boost::replace_all(r, ">", "&gt;");
    boost::replace_all(r, "\"", "&quot;");
    return r;
}

// rapidxml_print does not compile with recent compilers, so we write the (element only) tree ourselves
void print(ostream& out, const xml_node<char>* node, Size indent) {
    if (node->type() == node_data || node->type() == node_cdata) {
        out << escape(node->value(), node->value_size());
        return;
    }
    if (node->type() != node_element)
        return;

    string pad(indent, ' ');
    out << pad << '<' << string(node->name(), node->name_size());
    for (xml_attribute<char>* a = node->first_attribute(); a; a = a->next_attribute())
        out << ' ' << string(a->name(), a->name_size()) << "=\"" << escape(a->value(), a->value_size()) << '"';

    xml_node<char>* child = node->first_node();
    if (!child) {
        if (node->value_size() > 0)
            out << '>' << escape(node->value(), node->value_size()) << "</"
                << string(node->name(), node->name_size()) << ">\n";
        else
            out << "/>\n";
        return;
    }
    if (child->type() == node_data && !child->next_sibling()) {
        out << '>' << escape(child->value(), child->value_size()) << "</" << string(node->name(), node->name_size())
            << ">\n";
        return;
    }
    out << ">\n";
    for (; child; child = child->next_sibling()) {
        if (child->type() == node_element)
            print(out, child, indent + 2);
    }
    out << pad << "</" << string(node->name(), node->name_size()) << ">\n";
}

} // namespace

XMLDocument::XMLDocument() : _doc(new rapidxml::xml_document<char>()), _buffer(nullptr) {}

XMLDocument::XMLDocument(const string& fileName) : _doc(new rapidxml::xml_document<char>()), _buffer(nullptr) {
    // Need to load the entire file into memory to pass to doc.parse().
    ifstream t(fileName.c_str());
    if (!t.is_open()) {
        delete _doc;
        QL_FAIL("Failed to open file " << fileName);
    }
    stringstream buffer;
    buffer << t.rdbuf();
    try {
        parse(buffer.str());
    } catch (const std::exception& e) {
        delete _doc;
        delete[] _buffer;
        QL_FAIL("Error parsing XML file " << fileName << ": " << e.what());
    }
}

XMLDocument::~XMLDocument() {
    if (_doc != nullptr)
        delete _doc;
    if (_buffer != nullptr)
        delete[] _buffer;
}

void XMLDocument::parse(const string& text) {
    QL_REQUIRE(_buffer == nullptr, "XML document has already been parsed");
    _buffer = new char[text.size() + 1];
    strcpy(_buffer, text.c_str());
    _buffer[text.size()] = '\0';
    try {
        _doc->parse<0>(_buffer);
    } catch (const rapidxml::parse_error& pe) {
        string where = string(pe.where<char>()).substr(0, 30);
        QL_FAIL("RapidXML Parse Error : " << pe.what() << ". where=" << where);
    }
}

void XMLDocument::fromXMLString(const string& xmlString) { parse(xmlString); }

XMLNode* XMLDocument::getFirstNode(const string& name) const {
    return _doc->first_node(name == "" ? nullptr : name.c_str());
}

void XMLDocument::appendNode(XMLNode* node) { _doc->append_node(node); }

void XMLDocument::toFile(const string& fileName) const {
    std::ofstream ofs(fileName.c_str());
    QL_REQUIRE(ofs.is_open(), "Failed to open file " << fileName << " for writing");
    ofs << toString();
    ofs.close();
}

string XMLDocument::toString() const {
    ostringstream oss;
    for (xml_node<char>* n = _doc->first_node(); n; n = n->next_sibling())
        print(oss, n, 0);
    return oss.str();
}

XMLNode* XMLDocument::allocNode(const string& nodeName) {
    XMLNode* n = _doc->allocate_node(node_element, allocString(nodeName));
    QL_REQUIRE(n, "Failed to allocate XMLNode for " << nodeName);
    return n;
}

XMLNode* XMLDocument::allocNode(const string& nodeName, const string& nodeValue) {
    XMLNode* n = _doc->allocate_node(node_element, allocString(nodeName), allocString(nodeValue));
    QL_REQUIRE(n, "Failed to allocate XMLNode for " << nodeName);
    return n;
}

char* XMLDocument::allocString(const string& str) {
    char* s = _doc->allocate_string(str.c_str());
    QL_REQUIRE(s, "Failed to allocate string for " << str);
    return s;
}

xml_attribute<char>* XMLDocument::allocAttribute(const string& attrName, const string& attrValue) {
    xml_attribute<char>* a = _doc->allocate_attribute(allocString(attrName), allocString(attrValue));
    QL_REQUIRE(a, "Failed to allocate attribute " << attrName);
    return a;
}

void XMLSerializable::fromFile(const string& filename) {
    XMLDocument doc(filename);
    fromXML(doc.getFirstNode(""));
}

void XMLSerializable::toFile(const string& filename) const {
    XMLDocument doc;
    XMLNode* node = toXML(doc);
    doc.appendNode(node);
    doc.toFile(filename);
}

void XMLSerializable::fromXMLString(const string& xml) {
    XMLDocument doc;
    doc.fromXMLString(xml);
    fromXML(doc.getFirstNode(""));
}

string XMLSerializable::toXMLString() const {
    XMLDocument doc;
    XMLNode* node = toXML(doc);
    doc.appendNode(node);
    return doc.toString();
}

void XMLUtils::checkNode(XMLNode* node, const string& expectedName) {
    QL_REQUIRE(node, "XML Node is NULL (expected " << expectedName << ")");
    QL_REQUIRE(node->name() == expectedName,
               "XML Node name " << node->name() << " does not match expected name " << expectedName);
}

XMLNode* XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name) {
    QL_REQUIRE(n, "XML Node is NULL (adding " << name << ")");
    XMLNode* node = doc.allocNode(name);
    n->append_node(node);
    return node;
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, const char* value) {
    addChild(doc, n, name, string(value));
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, const string& value) {
    QL_REQUIRE(n, "XML Node is NULL (adding " << name << ")");
    if (value.size() == 0) {
        addChild(doc, n, name);
    } else {
        XMLNode* node = doc.allocNode(name, value);
        n->append_node(node);
    }
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, Real value) {
    // 17 significant digits, so that values survive a round trip exactly
    std::ostringstream oss;
    oss << std::setprecision(17) << value;
    addChild(doc, n, name, oss.str());
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, int value) {
    addChild(doc, n, name, std::to_string(value));
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, Size value) {
    addChild(doc, n, name, std::to_string(value));
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, bool value) {
    string s = value ? "true" : "false";
    addChild(doc, n, name, s);
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, const QuantLib::Period& value) {
    addChild(doc, n, name, to_string(value));
}

void XMLUtils::addChildren(XMLDocument& doc, XMLNode* n, const string& names, const string& name,
                           const vector<string>& values) {
    XMLNode* node = addChild(doc, n, names);
    for (Size i = 0; i < values.size(); ++i)
        addChild(doc, node, name, values[i]);
}

void XMLUtils::appendNode(XMLNode* parent, XMLNode* child) {
    QL_REQUIRE(parent, "XML Parent Node is NULL");
    QL_REQUIRE(child, "XML Child Node is NULL");
    parent->append_node(child);
}

void XMLUtils::addAttribute(XMLDocument& doc, XMLNode* node, const string& attrName, const string& attrValue) {
    QL_REQUIRE(node, "XML Node is NULL (adding attribute " << attrName << ")");
    node->append_attribute(doc.allocAttribute(attrName, attrValue));
}

string XMLUtils::getAttribute(XMLNode* node, const string& attrName) {
    QL_REQUIRE(node, "XMLNode is NULL (was looking for attribute " << attrName << ")");
    xml_attribute<char>* attr = node->first_attribute(attrName.c_str());
    if (attr && attr->value())
        return string(attr->value(), attr->value_size());
    return "";
}

XMLNode* XMLUtils::getChildNode(XMLNode* n, const string& name) {
    QL_REQUIRE(n, "XMLUtils::getChildNode(" << name << "): XML Node is NULL");
    return n->first_node(name == "" ? nullptr : name.c_str());
}

vector<XMLNode*> XMLUtils::getChildrenNodes(XMLNode* node, const string& name) {
    QL_REQUIRE(node, "XMLUtils::getChildrenNodes(" << name << "): XML Node is NULL");
    vector<XMLNode*> res;
    const char* p = name.size() == 0 ? nullptr : name.c_str();
    for (xml_node<char>* c = node->first_node(p); c; c = c->next_sibling(p))
        res.push_back(c);
    return res;
}

XMLNode* XMLUtils::getNextSibling(XMLNode* n, const string& name) {
    QL_REQUIRE(n, "XMLUtils::getNextSibling(" << name << "): XML Node is NULL");
    return n->next_sibling(name == "" ? nullptr : name.c_str());
}

string XMLUtils::getNodeName(XMLNode* node) {
    QL_REQUIRE(node, "XMLUtils::getNodeName(): XML Node is NULL");
    return string(node->name(), node->name_size());
}

string XMLUtils::getNodeValue(XMLNode* node) {
    QL_REQUIRE(node, "XMLUtils::getNodeValue(): XML Node is NULL");
    return boost::algorithm::trim_copy(string(node->value(), node->value_size()));
}

string XMLUtils::getChildValue(XMLNode* node, const string& name, bool mandatory, const string& defaultValue) {
    QL_REQUIRE(node, "XMLUtils::getChildValue(" << name << "): XML Node is NULL");
    xml_node<char>* child = node->first_node(name.c_str());
    if (!child) {
        QL_REQUIRE(!mandatory, "Error: mandatory child node " << name << " of " << getNodeName(node) << " not found");
        return defaultValue;
    }
    return getNodeValue(child);
}

Real XMLUtils::getChildValueAsDouble(XMLNode* node, const string& name, bool mandatory, Real defaultValue) {
    string s = getChildValue(node, name, mandatory);
    return s == "" ? defaultValue : parseReal(s);
}

int XMLUtils::getChildValueAsInt(XMLNode* node, const string& name, bool mandatory, int defaultValue) {
    string s = getChildValue(node, name, mandatory);
    return s == "" ? defaultValue : parseInteger(s);
}

bool XMLUtils::getChildValueAsBool(XMLNode* node, const string& name, bool mandatory, bool defaultValue) {
    string s = getChildValue(node, name, mandatory);
    return s == "" ? defaultValue : parseBool(s);
}

vector<string> XMLUtils::getChildrenValues(XMLNode* parent, const string& names, const string& name,
                                           bool mandatory) {
    vector<string> vec;
    XMLNode* node = getChildNode(parent, names);
    if (mandatory) {
        QL_REQUIRE(node, "Error: No XML Child Node for " << names << " found.");
    }
    if (node) {
        for (XMLNode* child = getChildNode(node, name); child; child = getNextSibling(child, name))
            vec.push_back(getNodeValue(child));
    }
    return vec;
}

string XMLUtils::toString(XMLNode* node) {
    QL_REQUIRE(node, "XMLUtils::toString(): XML Node is NULL");
    ostringstream oss;
    print(oss, node, 0);
    return oss.str();
}

} // namespace data
} // namespace cre

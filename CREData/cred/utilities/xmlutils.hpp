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

/*! \file cred/utilities/xmlutils.hpp
    \brief XML utility functions
    \ingroup utilities
*/

#pragma once

#include <ql/time/period.hpp>
#include <ql/types.hpp>

#include <string>
#include <vector>

// forward declarations for rapidxml, the parser is only included in the implementation
namespace rapidxml {
template <class Ch> class xml_node;
template <class Ch> class xml_document;
template <class Ch> class xml_attribute;
} // namespace rapidxml

namespace cre {
namespace data {
using QuantLib::Real;

typedef rapidxml::xml_node<char> XMLNode;

//! XML Document
/*! Wrapper class for the underlying XML library (rapidxml), it owns the document's memory.
  \ingroup utilities
*/
class XMLDocument {
public:
    //! create an empty doc.
    XMLDocument();
    //! load an xml doc from the given file
    XMLDocument(const std::string& filename);
    //! destructor
    ~XMLDocument();

    XMLDocument(const XMLDocument&) = delete;
    XMLDocument& operator=(const XMLDocument&) = delete;

    //! load a document from a hard-coded string
    void fromXMLString(const std::string& xmlString);

    //! returns the first node of the document with the given name, or nullptr
    XMLNode* getFirstNode(const std::string& name) const;
    void appendNode(XMLNode*);

    //! save the XML Document to the given file.
    void toFile(const std::string& filename) const;

    std::string toString() const;

    //! util functions that wrap rapidxml
    XMLNode* allocNode(const std::string& nodeName);
    XMLNode* allocNode(const std::string& nodeName, const std::string& nodeValue);
    char* allocString(const std::string& str);
    rapidxml::xml_attribute<char>* allocAttribute(const std::string& attrName, const std::string& attrValue);

private:
    void parse(const std::string& text);

    rapidxml::xml_document<char>* _doc;
    char* _buffer;
};

//! Base class for all serializable classes
/*!
  \ingroup utilities
 */
class XMLSerializable {
public:
    virtual ~XMLSerializable() {}
    virtual void fromXML(XMLNode* node) = 0;
    virtual XMLNode* toXML(XMLDocument& doc) const = 0;

    void fromFile(const std::string& filename);
    void toFile(const std::string& filename) const;

    //! Parse from XML string
    void fromXMLString(const std::string& xml);
    //! Parse from XML string
    std::string toXMLString() const;
};

//! XML Utilities Class
/*!
  \ingroup utilities
 */
class XMLUtils {
public:
    static void checkNode(XMLNode* n, const std::string& expectedName);

    static XMLNode* addChild(XMLDocument& doc, XMLNode* n, const std::string& name);
    static void addChild(XMLDocument& doc, XMLNode* n, const std::string& name, const std::string& value);
    static void addChild(XMLDocument& doc, XMLNode* n, const std::string& name, const char* value);
    static void addChild(XMLDocument& doc, XMLNode* n, const std::string& name, Real value);
    static void addChild(XMLDocument& doc, XMLNode* n, const std::string& name, int value);
    static void addChild(XMLDocument& doc, XMLNode* n, const std::string& name, QuantLib::Size value);
    static void addChild(XMLDocument& doc, XMLNode* n, const std::string& name, bool value);
    static void addChild(XMLDocument& doc, XMLNode* n, const std::string& name, const QuantLib::Period& value);

    //! Adds <code>\<names\>\<name\>values[0]\</name\>...\</names\></code>
    static void addChildren(XMLDocument& doc, XMLNode* n, const std::string& names, const std::string& name,
                            const std::vector<std::string>& values);

    static void appendNode(XMLNode* parent, XMLNode* child);

    static void addAttribute(XMLDocument& doc, XMLNode* n, const std::string& attrName, const std::string& attrValue);
    //! the attribute value, empty if the attribute is not present
    static std::string getAttribute(XMLNode* node, const std::string& attrName);

    //! first child node with the given name, any name if empty, nullptr if there is none
    static XMLNode* getChildNode(XMLNode* n, const std::string& name = "");
    static std::vector<XMLNode*> getChildrenNodes(XMLNode* node, const std::string& name);
    static XMLNode* getNextSibling(XMLNode* node, const std::string& name = "");

    static std::string getNodeName(XMLNode* n);
    static std::string getNodeValue(XMLNode* n);

    /*! Get the value of the child node with the given name, if the child is not found and mandatory is true
        an exception is thrown, otherwise the default value is returned */
    static std::string getChildValue(XMLNode* node, const std::string& name, bool mandatory = false,
                                     const std::string& defaultValue = std::string());
    static Real getChildValueAsDouble(XMLNode* node, const std::string& name, bool mandatory = false,
                                      Real defaultValue = 0.0);
    static int getChildValueAsInt(XMLNode* node, const std::string& name, bool mandatory = false,
                                  int defaultValue = 0);
    static bool getChildValueAsBool(XMLNode* node, const std::string& name, bool mandatory = false,
                                    bool defaultValue = true);
    static std::vector<std::string> getChildrenValues(XMLNode* node, const std::string& names,
                                                      const std::string& name, bool mandatory = false);

    //! Write a node out as a string
    static std::string toString(XMLNode* node);
};

} // namespace data
} // namespace cre

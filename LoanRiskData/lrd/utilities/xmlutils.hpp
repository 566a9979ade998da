/*
 Copyright (C) 2025 The LoanRisk Authors
 All rights reserved.

 This file is part of LoanRisk, a free-software/open-source library
 for loan portfolio cash flow projection and risk analysis.

 LoanRisk is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file lrd/utilities/xmlutils.hpp
    \brief XML utility functions
    \ingroup utilities
*/

#pragma once

#include <boost/property_tree/ptree.hpp>

#include <ql/types.hpp>

#include <list>
#include <string>
#include <vector>

namespace loanrisk {
namespace data {

//! An XML element: the element name together with its subtree (attributes, value and children)
typedef boost::property_tree::ptree::value_type XMLNode;

//! Small XML Document wrapper class.
/*! The document owns every node it hands out. Nodes are allocated detached and added to a parent with
    XMLUtils::appendNode() or to the document with appendNode(), which copies the subtree, so a node has to be
    populated before it is appended.
    \ingroup utilities
*/
class XMLDocument {
public:
    //! create an empty doc.
    XMLDocument();
    //! create a document from a file.
    explicit XMLDocument(const std::string& filename);
    //! destructor
    ~XMLDocument();

    XMLDocument(const XMLDocument&) = delete;
    XMLDocument& operator=(const XMLDocument&) = delete;

    //! load a document from a hard-coded string
    void fromXMLString(const std::string& xmlString);

    //! top level node with the given name, nullptr if there is none
    XMLNode* getFirstNode(const std::string& name);
    //! set the document's top level node
    void appendNode(XMLNode* node);

    //! save the XML Document to the given file.
    void toFile(const std::string& filename) const;
    //! return the XML Document as a string.
    std::string toString() const;

    //! allocate a new, detached node owned by this document
    XMLNode* allocNode(const std::string& nodeName);
    //! allocate a new, detached node with a value
    XMLNode* allocNode(const std::string& nodeName, const std::string& nodeValue);

private:
    boost::property_tree::ptree root_;
    std::list<XMLNode> nodes_;
};

//! Base class for all serializable classes
/*! \ingroup utilities */
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
/*! \ingroup utilities */
class XMLUtils {
public:
    // If mandatory == true, we throw if the node is not present, otherwise we return a default vale.
    static void checkNode(XMLNode* n, const std::string& expectedName);

    static XMLNode* addChild(XMLDocument& doc, XMLNode* n, const std::string& name);
    static void addChild(XMLDocument& doc, XMLNode* n, const std::string& name, const std::string& value);
    static void addChild(XMLDocument& doc, XMLNode* n, const std::string& name, const char* value);
    static void addChild(XMLDocument& doc, XMLNode* n, const std::string& name, QuantLib::Real value);
    static void addChild(XMLDocument& doc, XMLNode* n, const std::string& name, int value);
    static void addChild(XMLDocument& doc, XMLNode* n, const std::string& name, bool value);

    //! append a copy of the child's subtree to the parent node
    static void appendNode(XMLNode* parent, XMLNode* child);

    static void addAttribute(XMLDocument& doc, XMLNode* node, const std::string& attrName,
                             const std::string& attrValue);

    static std::string getChildValue(XMLNode* node, const std::string& name, bool mandatory = false,
                                     const std::string& defaultValue = std::string());
    static QuantLib::Real getChildValueAsDouble(XMLNode* node, const std::string& name, bool mandatory = false,
                                                double defaultValue = 0.0);
    static int getChildValueAsInt(XMLNode* node, const std::string& name, bool mandatory = false,
                                  int defaultValue = 0);
    static bool getChildValueAsBool(XMLNode* node, const std::string& name, bool mandatory = false,
                                    bool defaultValue = true);

    //! first child with the given name, or the first child of any name if \p name is empty, nullptr if absent
    static XMLNode* getChildNode(XMLNode* n, const std::string& name = "");
    //! all children with the given name, or all children if \p name is empty
    static std::vector<XMLNode*> getChildrenNodes(XMLNode* node, const std::string& name = "");

    static std::string getAttribute(XMLNode* node, const std::string& attrName);
    static std::string getNodeName(XMLNode* n);
    static std::string getNodeValue(XMLNode* node);
};

} // namespace data
} // namespace loanrisk

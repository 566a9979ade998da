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

#include <lrd/utilities/errors.hpp>
#include <lrd/utilities/log.hpp>
#include <lrd/utilities/parsers.hpp>
#include <lrd/utilities/to_string.hpp>
#include <lrd/utilities/xmlutils.hpp>

#include <boost/algorithm/string/trim.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <fstream>
#include <sstream>

using boost::property_tree::ptree;
using QuantLib::Real;
using std::string;
using std::vector;

namespace loanrisk {
namespace data {

namespace {

const string attributeKey = "<xmlattr>";
const string commentKey = "<xmlcomment>";

bool isElement(const XMLNode& n) { return n.first != attributeKey && n.first != commentKey; }

const int readFlags = boost::property_tree::xml_parser::trim_whitespace | boost::property_tree::xml_parser::no_comments;

} // namespace

XMLDocument::XMLDocument() {}

XMLDocument::XMLDocument(const string& fileName) {
    std::ifstream in(fileName);
    LOANRISK_REQUIRE_INPUT(in.is_open(), "Failed to open XML file " << fileName);
    try {
        boost::property_tree::read_xml(in, root_, readFlags);
    } catch (const boost::property_tree::xml_parser_error& e) {
        LOANRISK_REQUIRE_INPUT(false, "Error parsing XML file " << fileName << ": " << e.what());
    }
    DLOG("Loaded XML file " << fileName);
}

XMLDocument::~XMLDocument() {}

void XMLDocument::fromXMLString(const string& xmlString) {
    root_.clear();
    std::istringstream in(xmlString);
    try {
        boost::property_tree::read_xml(in, root_, readFlags);
    } catch (const boost::property_tree::xml_parser_error& e) {
        LOANRISK_REQUIRE_INPUT(false, "Error parsing XML string: " << e.what());
    }
}

XMLNode* XMLDocument::getFirstNode(const string& name) {
    for (auto& n : root_) {
        if (isElement(n) && (name.empty() || n.first == name))
            return &n;
    }
    return nullptr;
}

void XMLDocument::appendNode(XMLNode* node) {
    LOANRISK_REQUIRE_INPUT(node, "XMLDocument::appendNode(): node is null");
    root_.clear();
    root_.push_back(*node);
}

void XMLDocument::toFile(const string& fileName) const {
    std::ofstream out(fileName);
    QL_REQUIRE(out.is_open(), "Failed to open file " << fileName << " for writing");
    boost::property_tree::write_xml(out, root_, boost::property_tree::xml_writer_make_settings<string>(' ', 2));
    out.close();
}

string XMLDocument::toString() const {
    std::ostringstream oss;
    boost::property_tree::write_xml(oss, root_, boost::property_tree::xml_writer_make_settings<string>(' ', 2));
    return oss.str();
}

XMLNode* XMLDocument::allocNode(const string& nodeName) {
    nodes_.emplace_back(nodeName, ptree());
    return &nodes_.back();
}

XMLNode* XMLDocument::allocNode(const string& nodeName, const string& nodeValue) {
    nodes_.emplace_back(nodeName, ptree(nodeValue));
    return &nodes_.back();
}

void XMLSerializable::fromFile(const string& filename) {
    XMLDocument doc(filename);
    fromXML(doc.getFirstNode(""));
}

void XMLSerializable::toFile(const string& filename) const {
    XMLDocument doc;
    doc.appendNode(toXML(doc));
    doc.toFile(filename);
}

void XMLSerializable::fromXMLString(const string& xml) {
    XMLDocument doc;
    doc.fromXMLString(xml);
    fromXML(doc.getFirstNode(""));
}

string XMLSerializable::toXMLString() const {
    XMLDocument doc;
    doc.appendNode(toXML(doc));
    return doc.toString();
}

void XMLUtils::checkNode(XMLNode* node, const string& expectedName) {
    LOANRISK_REQUIRE_INPUT(node, "XML Node is NULL (expected " << expectedName << ")");
    LOANRISK_REQUIRE_INPUT(node->first == expectedName,
                           "XML Node name " << node->first << " does not match expected name " << expectedName);
}

XMLNode* XMLUtils::addChild(XMLDocument&, XMLNode* parent, const string& name) {
    QL_REQUIRE(parent, "XML Node is NULL (adding " << name << ")");
    auto it = parent->second.push_back(XMLNode(name, ptree()));
    return &*it;
}

void XMLUtils::addChild(XMLDocument&, XMLNode* parent, const string& name, const string& value) {
    QL_REQUIRE(parent, "XML Node is NULL (adding " << name << ")");
    parent->second.push_back(XMLNode(name, ptree(value)));
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, const char* value) {
    addChild(doc, n, name, string(value));
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, Real value) {
    addChild(doc, n, name, to_string(value));
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, int value) {
    addChild(doc, n, name, to_string(value));
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, bool value) {
    addChild(doc, n, name, string(value ? "true" : "false"));
}

void XMLUtils::appendNode(XMLNode* parent, XMLNode* child) {
    QL_REQUIRE(parent, "XML Node is NULL");
    QL_REQUIRE(child, "XML Node is NULL");
    parent->second.push_back(*child);
}

void XMLUtils::addAttribute(XMLDocument&, XMLNode* node, const string& attrName, const string& attrValue) {
    QL_REQUIRE(node, "XML Node is NULL (adding attribute " << attrName << ")");
    node->second.put(ptree::path_type(attributeKey + "/" + attrName, '/'), attrValue);
}

string XMLUtils::getChildValue(XMLNode* node, const string& name, bool mandatory, const string& defaultValue) {
    LOANRISK_REQUIRE_INPUT(node, "XMLUtils::getChildValue(" << name << ") node is NULL");
    XMLNode* child = getChildNode(node, name);
    if (mandatory) {
        LOANRISK_REQUIRE_INPUT(child, "Error: In Node " << getNodeName(node) << ", mandatory field \"" << name
                                                         << "\" not found.");
    }
    return child ? getNodeValue(child) : defaultValue;
}

Real XMLUtils::getChildValueAsDouble(XMLNode* node, const string& name, bool mandatory, double defaultValue) {
    string s = getChildValue(node, name, mandatory);
    return s.empty() ? defaultValue : parseReal(s);
}

int XMLUtils::getChildValueAsInt(XMLNode* node, const string& name, bool mandatory, int defaultValue) {
    string s = getChildValue(node, name, mandatory);
    return s.empty() ? defaultValue : parseInteger(s);
}

bool XMLUtils::getChildValueAsBool(XMLNode* node, const string& name, bool mandatory, bool defaultValue) {
    string s = getChildValue(node, name, mandatory);
    return s.empty() ? defaultValue : parseBool(s);
}

XMLNode* XMLUtils::getChildNode(XMLNode* n, const string& name) {
    QL_REQUIRE(n, "XMLUtils::getChildNode(" << name << "): XML Node is NULL");
    for (auto& c : n->second) {
        if (isElement(c) && (name.empty() || c.first == name))
            return &c;
    }
    return nullptr;
}

vector<XMLNode*> XMLUtils::getChildrenNodes(XMLNode* node, const string& name) {
    QL_REQUIRE(node, "XMLUtils::getChildrenNodes(" << name << "): XML Node is NULL");
    vector<XMLNode*> res;
    for (auto& c : node->second) {
        if (isElement(c) && (name.empty() || c.first == name))
            res.push_back(&c);
    }
    return res;
}

string XMLUtils::getAttribute(XMLNode* node, const string& attrName) {
    QL_REQUIRE(node, "XMLUtils::getAttribute(" << attrName << "): XML Node is NULL");
    return node->second.get(ptree::path_type(attributeKey + "/" + attrName, '/'), string());
}

string XMLUtils::getNodeName(XMLNode* node) {
    QL_REQUIRE(node, "XMLUtils::getNodeName(): XML Node is NULL");
    return node->first;
}

string XMLUtils::getNodeValue(XMLNode* node) {
    QL_REQUIRE(node, "XMLUtils::getNodeValue(): XML Node is NULL");
    return boost::algorithm::trim_copy(node->second.data());
}

} // namespace data
} // namespace loanrisk

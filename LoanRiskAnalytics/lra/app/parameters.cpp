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


#include <lra/app/parameters.hpp>

#include <lrd/utilities/errors.hpp>
#include <lrd/utilities/log.hpp>
#include <lrd/utilities/parsers.hpp>

#include <set>

using std::string;

namespace loanrisk {
namespace analytics {

namespace {
// groups stored at the top level, every other group is an analytic
const std::set<string> topLevelGroups = {"setup", "logging"};

map<string, string> readGroup(XMLNode* groupNode) {
    map<string, string> group;
    for (XMLNode* child : XMLUtils::getChildrenNodes(groupNode, "Parameter")) {
        string key = XMLUtils::getAttribute(child, "name");
        LOANRISK_REQUIRE_INPUT(!key.empty(), "parameter without name in group " << XMLUtils::getNodeName(groupNode));
        group[key] = XMLUtils::getNodeValue(child);
    }
    return group;
}

void writeGroup(XMLDocument& doc, XMLNode* groupNode, const map<string, string>& group) {
    for (const auto& p : group) {
        XMLNode* child = doc.allocNode("Parameter", p.second);
        XMLUtils::addAttribute(doc, child, "name", p.first);
        XMLUtils::appendNode(groupNode, child);
    }
}
} // namespace

bool Parameters::hasGroup(const string& groupName) const { return (data_.find(groupName) != data_.end()); }

bool Parameters::has(const string& groupName, const string& paramName) const {
    auto it = data_.find(groupName);
    return it != data_.end() && it->second.find(paramName) != it->second.end();
}

string Parameters::get(const string& groupName, const string& paramName, bool fail) const {
    if (has(groupName, paramName))
        return data_.find(groupName)->second.find(paramName)->second;
    LOANRISK_REQUIRE_INPUT(!fail, "parameter " << paramName << " not found in param group " << groupName);
    return "";
}

const map<string, string>& Parameters::data(const string& groupName) const {
    auto it = data_.find(groupName);
    LOANRISK_REQUIRE_INPUT(it != data_.end(), "param group '" << groupName << "' not found");
    return it->second;
}

void Parameters::set(const string& groupName, const string& paramName, const string& value) {
    data_[groupName][paramName] = value;
}

bool Parameters::isActive(const string& analytic) const {
    string active = get(analytic, "active", false);
    return !active.empty() && parseBool(active);
}

void Parameters::fromFile(const string& fileName) {
    LOG("load LoanRisk configuration from " << fileName);
    clear();
    XMLDocument doc(fileName);
    fromXML(doc.getFirstNode("LoanRisk"));
    LOG("load LoanRisk configuration from " << fileName << " done.");
}

void Parameters::clear() { data_.clear(); }

void Parameters::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "LoanRisk");

    XMLNode* setupNode = XMLUtils::getChildNode(node, "Setup");
    LOANRISK_REQUIRE_INPUT(setupNode, "node Setup not found in parameter file");
    data_["setup"] = readGroup(setupNode);

    if (XMLNode* loggingNode = XMLUtils::getChildNode(node, "Logging"))
        data_["logging"] = readGroup(loggingNode);

    if (XMLNode* analyticsNode = XMLUtils::getChildNode(node, "Analytics")) {
        for (XMLNode* child : XMLUtils::getChildrenNodes(analyticsNode, "Analytic")) {
            string groupName = XMLUtils::getAttribute(child, "type");
            LOANRISK_REQUIRE_INPUT(!groupName.empty(), "Analytic node without type attribute");
            LOANRISK_REQUIRE_INPUT(topLevelGroups.find(groupName) == topLevelGroups.end(),
                                   "Analytic type '" << groupName << "' is reserved");
            data_[groupName] = readGroup(child);
        }
    }
}

XMLNode* Parameters::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("LoanRisk");

    XMLNode* setupNode = doc.allocNode("Setup");
    if (hasGroup("setup"))
        writeGroup(doc, setupNode, data("setup"));
    XMLUtils::appendNode(node, setupNode);

    if (hasGroup("logging")) {
        XMLNode* loggingNode = doc.allocNode("Logging");
        writeGroup(doc, loggingNode, data("logging"));
        XMLUtils::appendNode(node, loggingNode);
    }

    XMLNode* analyticsNode = doc.allocNode("Analytics");
    for (const auto& g : data_) {
        if (topLevelGroups.find(g.first) != topLevelGroups.end())
            continue;
        XMLNode* analyticNode = doc.allocNode("Analytic");
        XMLUtils::addAttribute(doc, analyticNode, "type", g.first);
        writeGroup(doc, analyticNode, g.second);
        XMLUtils::appendNode(analyticsNode, analyticNode);
    }
    XMLUtils::appendNode(node, analyticsNode);

    return node;
}

void Parameters::log() const {
    LOG("Parameters:");
    for (const auto& p : data_)
        for (const auto& pp : p.second)
            LOG("group = " << p.first << " : " << pp.first << " = " << pp.second);
}

} // namespace analytics
} // namespace loanrisk

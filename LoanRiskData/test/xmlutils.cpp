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


#include <boost/test/unit_test.hpp>
#include <lrd/utilities/errors.hpp>
#include <lrd/utilities/xmlutils.hpp>
#include <lrt/fileutilities.hpp>
#include <lrt/toplevelfixture.hpp>

using namespace loanrisk::data;
using namespace QuantLib;
using std::string;

namespace {

// Fixture used in each test case below
class F : public loanrisk::test::TopLevelFixture {
public:
    XMLDocument testDoc;

    F() {
        string testXML = "<root>"
                         "<level1>"
                         "<data1a attr=\"0.7736\">17.5</data1a>"
                         "<flag>Y</flag>"
                         "<count> 12 </count>"
                         "</level1>"
                         "<!-- a comment -->"
                         "<level2>"
                         "<item>a</item><item>b</item><item>c</item>"
                         "</level2>"
                         "</root>";
        testDoc.fromXMLString(testXML);
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(LoanRiskDataTestSuite, loanrisk::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(XmlUtilsTests)

BOOST_FIXTURE_TEST_CASE(testXMLDataGetters, F) {

    BOOST_TEST_MESSAGE("Testing XML data getters...");

    XMLNode* root = testDoc.getFirstNode("root");
    BOOST_CHECK_NO_THROW(XMLUtils::checkNode(root, "root"));
    BOOST_CHECK_THROW(XMLUtils::checkNode(root, "other"), InvalidInputError);
    BOOST_CHECK(testDoc.getFirstNode("other") == nullptr);

    XMLNode* level1 = XMLUtils::getChildNode(root, "level1");
    BOOST_REQUIRE(level1);
    BOOST_CHECK_EQUAL(XMLUtils::getChildValue(level1, "data1a"), "17.5");
    BOOST_CHECK_EQUAL(XMLUtils::getChildValueAsDouble(level1, "data1a", true), 17.5);
    BOOST_CHECK(XMLUtils::getChildValueAsBool(level1, "flag", true));
    BOOST_CHECK_EQUAL(XMLUtils::getChildValueAsInt(level1, "count", true), 12);
    BOOST_CHECK_EQUAL(XMLUtils::getAttribute(XMLUtils::getChildNode(level1, "data1a"), "attr"), "0.7736");
    BOOST_CHECK_EQUAL(XMLUtils::getAttribute(XMLUtils::getChildNode(level1, "data1a"), "missing"), "");

    // optional values fall back to the default
    BOOST_CHECK_EQUAL(XMLUtils::getChildValue(level1, "missing", false, "dflt"), "dflt");
    BOOST_CHECK_EQUAL(XMLUtils::getChildValueAsDouble(level1, "missing", false, 2.5), 2.5);
    BOOST_CHECK_THROW(XMLUtils::getChildValue(level1, "missing", true), InvalidInputError);

    // comments are not elements
    XMLNode* level2 = XMLUtils::getChildNode(root, "level2");
    BOOST_REQUIRE(level2);
    BOOST_CHECK_EQUAL(XMLUtils::getChildrenNodes(root).size(), 2);
    std::vector<XMLNode*> items = XMLUtils::getChildrenNodes(level2, "item");
    BOOST_REQUIRE_EQUAL(items.size(), 3);
    BOOST_CHECK_EQUAL(XMLUtils::getNodeValue(items[2]), "c");
    BOOST_CHECK_EQUAL(XMLUtils::getNodeName(items[0]), "item");
}

BOOST_AUTO_TEST_CASE(testXMLBuilding) {

    BOOST_TEST_MESSAGE("Testing XML document building...");

    XMLDocument doc;
    XMLNode* root = doc.allocNode("Root");
    XMLUtils::addAttribute(doc, root, "version", "2");
    XMLUtils::addChild(doc, root, "Name", "loan");
    XMLUtils::addChild(doc, root, "Rate", 0.0599);
    XMLUtils::addChild(doc, root, "Term", 60);
    XMLUtils::addChild(doc, root, "Active", true);
    XMLNode* child = doc.allocNode("Child", "value");
    XMLUtils::appendNode(root, child);
    doc.appendNode(root);

    XMLDocument copy;
    copy.fromXMLString(doc.toString());
    XMLNode* r = copy.getFirstNode("Root");
    BOOST_REQUIRE(r);
    BOOST_CHECK_EQUAL(XMLUtils::getAttribute(r, "version"), "2");
    BOOST_CHECK_EQUAL(XMLUtils::getChildValue(r, "Name"), "loan");
    BOOST_CHECK_EQUAL(XMLUtils::getChildValueAsDouble(r, "Rate"), 0.0599);
    BOOST_CHECK_EQUAL(XMLUtils::getChildValueAsInt(r, "Term"), 60);
    BOOST_CHECK(XMLUtils::getChildValueAsBool(r, "Active", true, false));
    BOOST_CHECK_EQUAL(XMLUtils::getChildValue(r, "Child"), "value");
}

BOOST_AUTO_TEST_CASE(testXMLFiles) {

    BOOST_TEST_MESSAGE("Testing XML file input and output...");

    loanrisk::test::TemporaryDirectory dir;
    string file = dir.file("doc.xml");

    XMLDocument doc;
    XMLNode* root = doc.allocNode("Root");
    XMLUtils::addChild(doc, root, "Value", 1.25);
    doc.appendNode(root);
    doc.toFile(file);

    XMLDocument read(file);
    BOOST_CHECK_EQUAL(XMLUtils::getChildValueAsDouble(read.getFirstNode("Root"), "Value", true), 1.25);

    BOOST_CHECK_THROW(XMLDocument(dir.file("missing.xml")), InvalidInputError);
    XMLDocument bad;
    BOOST_CHECK_THROW(bad.fromXMLString("<Root><Unclosed></Root>"), InvalidInputError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

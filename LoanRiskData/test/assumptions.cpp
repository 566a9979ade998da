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
#include <lrd/configuration/assumptions.hpp>
#include <lrd/utilities/errors.hpp>
#include <lrt/toplevelfixture.hpp>

using namespace loanrisk::data;
using namespace QuantLib;
using std::string;

namespace {
const string assumptionsXml = "<Assumptions>"
                              "  <Tiers>"
                              "    <Tier name=\"default\"><CPR>0.05</CPR><CreditCost>0.01</CreditCost></Tier>"
                              "    <Tier name=\"A\"><CPR>0.08</CPR><PD>0.02</PD><LGD>0.45</LGD></Tier>"
                              "  </Tiers>"
                              "  <Fees>"
                              "    <ServicingFeeRate>0.0025</ServicingFeeRate>"
                              "    <ReportingFeeRate>0.0005</ReportingFeeRate>"
                              "  </Fees>"
                              "  <InvestorShare>0.9</InvestorShare>"
                              "  <CreditLossReducesInterest>true</CreditLossReducesInterest>"
                              "  <AmortizationMethod>Reamortizing</AmortizationMethod>"
                              "</Assumptions>";
}

BOOST_FIXTURE_TEST_SUITE(LoanRiskDataTestSuite, loanrisk::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(AssumptionsTests)

BOOST_AUTO_TEST_CASE(testTierAssumption) {

    BOOST_TEST_MESSAGE("Testing tier assumptions...");

    TierAssumption direct("default", 0.05, 0.01);
    BOOST_CHECK_EQUAL(direct.cpr(), 0.05);
    BOOST_CHECK_EQUAL(direct.creditCost(), 0.01);
    BOOST_CHECK(!direct.hasPdLgd());

    TierAssumption pdLgd("A", 0.08, 0.02, 0.45);
    BOOST_CHECK(pdLgd.hasPdLgd());
    BOOST_CHECK_CLOSE(pdLgd.creditCost(), 0.009, 1e-10);

    BOOST_CHECK_THROW(TierAssumption("", 0.05, 0.01), InvalidInputError);
    BOOST_CHECK_THROW(TierAssumption("X", 1.0, 0.01), InvalidInputError);
    BOOST_CHECK_THROW(TierAssumption("X", -0.01, 0.01), InvalidInputError);
    BOOST_CHECK_THROW(TierAssumption("X", 0.05, 1.0), InvalidInputError);
    BOOST_CHECK_THROW(TierAssumption("X", 0.05, 1.5, 0.5), InvalidInputError);
    BOOST_CHECK_THROW(TierAssumption("X", 0.05, 0.5, -0.1), InvalidInputError);
}

BOOST_AUTO_TEST_CASE(testTierCreditForms) {

    BOOST_TEST_MESSAGE("Testing that exactly one credit cost form is accepted...");

    TierAssumption t;
    BOOST_CHECK_THROW(t.fromXMLString("<Tier name=\"X\"><CPR>0.05</CPR></Tier>"), InvalidInputError);
    BOOST_CHECK_THROW(t.fromXMLString("<Tier name=\"X\"><CPR>0.05</CPR><CreditCost>0.01</CreditCost>"
                                      "<PD>0.02</PD><LGD>0.4</LGD></Tier>"),
                      InvalidInputError);
    BOOST_CHECK_THROW(t.fromXMLString("<Tier name=\"X\"><CPR>0.05</CPR><PD>0.02</PD></Tier>"), InvalidInputError);
    BOOST_CHECK_THROW(t.fromXMLString("<Tier name=\"X\"><CreditCost>0.01</CreditCost></Tier>"), InvalidInputError);

    BOOST_CHECK_NO_THROW(t.fromXMLString("<Tier name=\"X\"><CPR>0.05</CPR><PD>0.1</PD><LGD>0.5</LGD></Tier>"));
    BOOST_CHECK_EQUAL(t.name(), "X");
    BOOST_CHECK_CLOSE(t.creditCost(), 0.05, 1e-10);
}

BOOST_AUTO_TEST_CASE(testAssumptionSetFromXml) {

    BOOST_TEST_MESSAGE("Testing assumption set parsing...");

    AssumptionSet a;
    a.fromXMLString(assumptionsXml);

    BOOST_CHECK_EQUAL(a.tiers().size(), 2);
    BOOST_CHECK_EQUAL(a.servicingFeeRate(), 0.0025);
    BOOST_CHECK_EQUAL(a.reportingFeeRate(), 0.0005);
    BOOST_CHECK_EQUAL(a.originationFeeRate(), 0.0);
    BOOST_CHECK_EQUAL(a.investorShare(), 0.9);
    BOOST_CHECK(a.creditLossReducesInterest());
    BOOST_CHECK(!a.interestOnStartingBalance());
    BOOST_CHECK(!a.negativeAmortization());
    BOOST_CHECK(a.amortizationMethod() == AmortizationMethod::Reamortizing);

    // serialise and read back
    AssumptionSet b;
    b.fromXMLString(a.toXMLString());
    BOOST_CHECK_EQUAL(b.tiers().size(), 2);
    BOOST_CHECK_CLOSE(b.resolve("A").creditCost(), 0.009, 1e-10);
    BOOST_CHECK_EQUAL(b.investorShare(), 0.9);
    BOOST_CHECK(b.amortizationMethod() == AmortizationMethod::Reamortizing);
}

BOOST_AUTO_TEST_CASE(testTierResolution) {

    BOOST_TEST_MESSAGE("Testing tier resolution with default fallback...");

    AssumptionSet a;
    a.fromXMLString(assumptionsXml);

    BOOST_CHECK_EQUAL(a.resolve("A").name(), "A");
    BOOST_CHECK_EQUAL(a.resolve("Z").name(), "default");
    BOOST_CHECK_EQUAL(a.resolve("").name(), "default");
    // tier names are case sensitive
    BOOST_CHECK_EQUAL(a.resolve("a").name(), "default");

    AssumptionSet empty;
    BOOST_CHECK_THROW(empty.resolve("A"), InvalidInputError);
}

BOOST_AUTO_TEST_CASE(testInvalidAssumptionSets) {

    BOOST_TEST_MESSAGE("Testing invalid assumption sets...");

    AssumptionSet a;
    // no default tier
    BOOST_CHECK_THROW(a.fromXMLString("<Assumptions><Tiers><Tier name=\"A\"><CPR>0.05</CPR>"
                                      "<CreditCost>0.01</CreditCost></Tier></Tiers></Assumptions>"),
                      InvalidInputError);
    // duplicate tier
    BOOST_CHECK_THROW(a.fromXMLString("<Assumptions><Tiers>"
                                      "<Tier name=\"default\"><CPR>0.05</CPR><CreditCost>0.01</CreditCost></Tier>"
                                      "<Tier name=\"default\"><CPR>0.06</CPR><CreditCost>0.01</CreditCost></Tier>"
                                      "</Tiers></Assumptions>"),
                      InvalidInputError);
    // negative fee
    BOOST_CHECK_THROW(a.fromXMLString("<Assumptions><Tiers>"
                                      "<Tier name=\"default\"><CPR>0.05</CPR><CreditCost>0.01</CreditCost></Tier>"
                                      "</Tiers><Fees><ServicingFeeRate>-0.001</ServicingFeeRate></Fees>"
                                      "</Assumptions>"),
                      InvalidInputError);
    // investor share out of range
    BOOST_CHECK_THROW(a.fromXMLString("<Assumptions><Tiers>"
                                      "<Tier name=\"default\"><CPR>0.05</CPR><CreditCost>0.01</CreditCost></Tier>"
                                      "</Tiers><InvestorShare>1.2</InvestorShare></Assumptions>"),
                      InvalidInputError);
    // wrong root node
    BOOST_CHECK_THROW(a.fromXMLString("<Tiers/>"), InvalidInputError);

    BOOST_CHECK_THROW(AssumptionSet(TierAssumption("A", 0.05, 0.01)), InvalidInputError);
    BOOST_CHECK_THROW(parseAmortizationMethod("Bullet"), InvalidInputError);
}

BOOST_AUTO_TEST_CASE(testProgrammaticSet) {

    BOOST_TEST_MESSAGE("Testing programmatic assumption set construction...");

    AssumptionSet a(TierAssumption("default", 0.05, 0.01));
    a.addTier(TierAssumption("B", 0.10, 0.02));
    a.servicingFeeRate() = 0.0025;
    a.negativeAmortization() = true;

    BOOST_CHECK(a.hasTier("B"));
    BOOST_CHECK_EQUAL(a.resolve("B").cpr(), 0.10);
    BOOST_CHECK_EQUAL(a.servicingFeeRate(), 0.0025);
    BOOST_CHECK(a.negativeAmortization());
    BOOST_CHECK_NO_THROW(a.check());

    a.investorShare() = 0.0;
    BOOST_CHECK_THROW(a.check(), InvalidInputError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

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
#include <lrd/utilities/csvfilereader.hpp>
#include <lrt/fileutilities.hpp>
#include <lrt/toplevelfixture.hpp>
#include <ql/errors.hpp>

using namespace loanrisk::data;
using QuantLib::Size;
using std::string;

BOOST_FIXTURE_TEST_SUITE(LoanRiskDataTestSuite, loanrisk::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(CSVReaderTests)

BOOST_AUTO_TEST_CASE(testBufferReader) {

    BOOST_TEST_MESSAGE("Testing CSV buffer reader...");

    string buffer = "#LoanId,Balance,Tier\n"
                    "L1,25000,A\n"
                    "\n"
                    "# a comment line\n"
                    "L2, 50000 ,\"B,C\"\n";
    CSVBufferReader reader(buffer, true);

    BOOST_CHECK_EQUAL(reader.numberOfColumns(), 3);
    BOOST_CHECK(reader.hasField("LoanId"));
    BOOST_CHECK(reader.hasField("Tier"));
    BOOST_CHECK(!reader.hasField("Rate"));

    BOOST_REQUIRE(reader.next());
    BOOST_CHECK_EQUAL(reader.currentLine(), 0);
    BOOST_CHECK_EQUAL(reader.get("LoanId"), "L1");
    BOOST_CHECK_EQUAL(reader.get(1), "25000");

    BOOST_REQUIRE(reader.next());
    BOOST_CHECK_EQUAL(reader.currentLine(), 1);
    BOOST_CHECK_EQUAL(reader.get("Balance"), "50000");
    BOOST_CHECK_EQUAL(reader.get("Tier"), "B,C");
    BOOST_CHECK_THROW(reader.get("Rate"), QuantLib::Error);
    BOOST_CHECK_THROW(reader.get(3), QuantLib::Error);

    BOOST_CHECK(!reader.next());
}

BOOST_AUTO_TEST_CASE(testInconsistentColumns) {

    BOOST_TEST_MESSAGE("Testing CSV reader with an inconsistent number of columns...");

    CSVBufferReader reader("LoanId,Balance\nL1\n", true);
    BOOST_CHECK_THROW(reader.next(), QuantLib::Error);

    BOOST_CHECK_THROW(CSVBufferReader("", true), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testFileReader) {

    BOOST_TEST_MESSAGE("Testing CSV file reader...");

    loanrisk::test::TemporaryDirectory dir;
    string file = dir.file("loans.csv");
    loanrisk::test::writeFile(file, "LoanId;Balance\nL1;100\nL2;200\n");

    CSVFileReader reader(file, true);
    Size n = 0;
    while (reader.next())
        ++n;
    reader.close();
    BOOST_CHECK_EQUAL(n, 2);

    BOOST_CHECK_THROW(CSVFileReader(dir.file("missing.csv"), true), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

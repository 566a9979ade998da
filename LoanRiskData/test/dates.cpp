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
#include <lrd/utilities/dates.hpp>
#include <lrd/utilities/errors.hpp>
#include <lrt/toplevelfixture.hpp>

using namespace loanrisk::data;
using namespace QuantLib;

BOOST_FIXTURE_TEST_SUITE(LoanRiskDataTestSuite, loanrisk::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(DatesTests)

BOOST_AUTO_TEST_CASE(testYearFraction) {

    BOOST_TEST_MESSAGE("Testing actual/actual ISDA year fractions...");

    // a common year and a leap year
    BOOST_CHECK_CLOSE(yearFraction(Date(1, January, 2025), Date(1, January, 2026)), 1.0, 1e-12);
    BOOST_CHECK_CLOSE(yearFraction(Date(1, January, 2024), Date(1, January, 2025)), 1.0, 1e-12);

    // one month in a common year
    BOOST_CHECK_CLOSE(yearFraction(Date(1, January, 2025), Date(1, February, 2025)), 31.0 / 365.0, 1e-12);

    // across a year boundary each day is weighted by its own year
    Time t = yearFraction(Date(1, December, 2023), Date(1, February, 2024));
    BOOST_CHECK_CLOSE(t, 31.0 / 365.0 + 31.0 / 366.0, 1e-12);

    BOOST_CHECK_EQUAL(yearFraction(Date(1, March, 2025), Date(1, March, 2025)), 0.0);
    BOOST_CHECK_THROW(yearFraction(Date(), Date(1, March, 2025)), InvalidInputError);
}

BOOST_AUTO_TEST_CASE(testAddMonths) {

    BOOST_TEST_MESSAGE("Testing month arithmetic...");

    BOOST_CHECK_EQUAL(addMonths(Date(31, January, 2025), 1), Date(28, February, 2025));
    BOOST_CHECK_EQUAL(addMonths(Date(31, January, 2024), 1), Date(29, February, 2024));
    BOOST_CHECK_EQUAL(addMonths(Date(15, November, 2025), 2), Date(15, January, 2026));
    // offsets are taken from the start date, a 31st start returns to the 31st
    BOOST_CHECK_EQUAL(addMonths(Date(31, January, 2025), 2), Date(31, March, 2025));
    BOOST_CHECK_EQUAL(addMonths(Date(1, January, 2025), 59), Date(1, December, 2029));
    BOOST_CHECK_THROW(addMonths(Date(), 1), InvalidInputError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

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


#include <boost/timer/timer.hpp>

#include <iostream>

#define BOOST_TEST_MODULE LoanRiskAnalyticsTestSuite
#include <boost/test/included/unit_test.hpp>
#include <boost/test/unit_test.hpp>

#include <lrt/log.hpp>

//! Global fixture of the LoanRiskAnalytics test module
/*! Routes the library log into the test log if requested, see setupTestLogging(), and reports the run time. */
class LraGlobalFixture {
public:
    LraGlobalFixture() {
        auto& suite = boost::unit_test::framework::master_test_suite();
        loanrisk::test::setupTestLogging(suite.argc, suite.argv);
    }

    ~LraGlobalFixture() {
        timer_.stop();
        std::cout << std::endl
                  << "LoanRiskAnalytics tests completed in " << timer_.format(2, "%ws wall, %ts cpu") << std::endl;
    }

private:
    boost::timer::cpu_timer timer_;
};

BOOST_TEST_GLOBAL_FIXTURE(LraGlobalFixture);

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


#include "testdata.hpp"

#include <boost/test/unit_test.hpp>
#include <lra/engine/cashflowaggregator.hpp>
#include <lra/engine/cashflowengine.hpp>
#include <lrd/utilities/errors.hpp>
#include <lrd/utilities/log.hpp>
#include <lrt/log.hpp>
#include <lrt/toplevelfixture.hpp>

#include <set>

using namespace loanrisk::analytics;
using namespace loanrisk::data;
using namespace QuantLib;
using loanrisk::test::snapshotDate;
using std::string;
using std::vector;

namespace {

Real total(const vector<PortfolioMonthlyTotal>& totals, Real CashFlowAmounts::*field) {
    Real s = 0.0;
    for (const auto& t : totals)
        s += t.*field;
    return s;
}

Real total(const vector<LoanCashFlows>& flows, Real CashFlowAmounts::*field) {
    Real s = 0.0;
    for (const auto& f : flows)
        for (const auto& r : f.rows)
            s += r.*field;
    return s;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(LoanRiskAnalyticsTestSuite, loanrisk::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(CashFlowEngineTests)

BOOST_AUTO_TEST_CASE(testAggregation) {

    BOOST_TEST_MESSAGE("Testing portfolio monthly totals...");

    CashFlowResults res = computeCashFlows(loanrisk::test::threeLoans(), *loanrisk::test::baseAssumptions());
    BOOST_REQUIRE(res.monthlyTotals);
    const vector<PortfolioMonthlyTotal>& totals = *res.monthlyTotals;

    // one total per month of the longest loan, in date order
    BOOST_REQUIRE_EQUAL(totals.size(), 60);
    for (Size i = 1; i < totals.size(); ++i)
        BOOST_CHECK(totals[i - 1].date < totals[i].date);
    BOOST_CHECK_EQUAL(totals.front().date, snapshotDate());
    BOOST_CHECK_EQUAL(totals.front().numberOfLoans, 3);
    // prepayments shorten the lives, only L1 is still outstanding in month 52 and none in month 60
    BOOST_CHECK_EQUAL(totals[51].numberOfLoans, 1);
    BOOST_CHECK_EQUAL(totals.back().numberOfLoans, 0);
    BOOST_CHECK_CLOSE(totals.front().startingBalance, 90000.0, 1e-12);

    for (const auto& f : cashFlowAmountFields())
        BOOST_CHECK_CLOSE(total(totals, f.second) + 1.0, total(res.loanCashFlows, f.second) + 1.0, 1e-10);

    // portfolio conservation of principal
    BOOST_CHECK_CLOSE(total(totals, &CashFlowAmounts::totalPrincipal) + total(totals, &CashFlowAmounts::creditLoss),
                      90000.0, 1e-10);
}

BOOST_AUTO_TEST_CASE(testGroupedAggregation) {

    BOOST_TEST_MESSAGE("Testing grouped monthly totals...");

    vector<LoanRecord> loans = {LoanRecord("A1", 1000.0, 0.05, 12, snapshotDate(), "A"),
                                LoanRecord("A2", 2000.0, 0.05, 12, snapshotDate(), "A"),
                                LoanRecord("U1", 3000.0, 0.05, 6, snapshotDate())};
    CashFlowResults res = computeCashFlows(loans, *loanrisk::test::zeroAssumptions(), true, {tierKey});
    const vector<PortfolioMonthlyTotal>& totals = *res.monthlyTotals;

    // 12 months of tier A, 6 months of the untiered loan grouped as default, ordered by date then group
    BOOST_REQUIRE_EQUAL(totals.size(), 18);
    BOOST_CHECK_EQUAL(totals[0].group, "A");
    BOOST_CHECK_EQUAL(totals[1].group, "default");
    BOOST_CHECK_EQUAL(totals[0].date, totals[1].date);
    BOOST_CHECK_EQUAL(totals[0].numberOfLoans, 2);
    BOOST_CHECK_CLOSE(totals[0].startingBalance, 3000.0, 1e-12);
    BOOST_CHECK_CLOSE(totals[1].startingBalance, 3000.0, 1e-12);

    CashFlowAggregator byTierAndLoan({tierKey, loanIdKey});
    BOOST_CHECK_EQUAL(byTierAndLoan.group(res.loanCashFlows[0]), "A|A1");
    BOOST_CHECK_EQUAL(byTierAndLoan.aggregate(res.loanCashFlows).size(), 30);

    BOOST_CHECK_EQUAL(parseGroupingKey("tier")(res.loanCashFlows[2]), "default");
    BOOST_CHECK_EQUAL(parseGroupingKey("LoanId")(res.loanCashFlows[2]), "U1");
    BOOST_CHECK_THROW(parseGroupingKey("Region"), InvalidInputError);
}

BOOST_AUTO_TEST_CASE(testMergePartials) {

    BOOST_TEST_MESSAGE("Testing merge of partial monthly totals...");

    vector<LoanRecord> loans = loanrisk::test::mixedLoans(12);
    CashFlowResults all = computeCashFlows(loans, *loanrisk::test::baseAssumptions());

    CashFlowAggregator aggregator;
    vector<LoanCashFlows> first(all.loanCashFlows.begin(), all.loanCashFlows.begin() + 5);
    vector<LoanCashFlows> second(all.loanCashFlows.begin() + 5, all.loanCashFlows.end());
    vector<PortfolioMonthlyTotal> merged =
        CashFlowAggregator::merge({aggregator.aggregate(first), aggregator.aggregate(second)});

    BOOST_REQUIRE_EQUAL(merged.size(), all.monthlyTotals->size());
    for (Size i = 0; i < merged.size(); ++i) {
        BOOST_CHECK_EQUAL(merged[i].date, (*all.monthlyTotals)[i].date);
        BOOST_CHECK_EQUAL(merged[i].numberOfLoans, (*all.monthlyTotals)[i].numberOfLoans);
        BOOST_CHECK_CLOSE(merged[i].totalPayment + 1.0, (*all.monthlyTotals)[i].totalPayment + 1.0, 1e-10);
    }
}

BOOST_AUTO_TEST_CASE(testThreadCountDoesNotChangeResults) {

    BOOST_TEST_MESSAGE("Testing that the number of threads does not change the results...");

    vector<LoanRecord> loans = loanrisk::test::mixedLoans(37);
    auto assumptions = loanrisk::test::baseAssumptions();
    assumptions->addTier(TierAssumption("A", 0.10, 0.02));
    assumptions->addTier(TierAssumption("C", 0.02, 0.05, 0.4));

    CashFlowResults single = CashFlowEngine(assumptions, 1).run(loans, true, {tierKey});
    for (Size n : {2, 4, 8, 64}) {
        CashFlowResults multi = CashFlowEngine(assumptions, n).run(loans, true, {tierKey});
        BOOST_REQUIRE_EQUAL(multi.loanCashFlows.size(), loans.size());
        for (Size i = 0; i < loans.size(); ++i) {
            const LoanCashFlows& a = single.loanCashFlows[i];
            const LoanCashFlows& b = multi.loanCashFlows[i];
            BOOST_CHECK_EQUAL(b.loanId, loans[i].id());
            BOOST_CHECK_EQUAL(a.resolvedTier, b.resolvedTier);
            BOOST_REQUIRE_EQUAL(a.rows.size(), b.rows.size());
            for (Size k = 0; k < a.rows.size(); ++k) {
                BOOST_CHECK_EQUAL(a.rows[k].date, b.rows[k].date);
                for (const auto& f : cashFlowAmountFields())
                    BOOST_CHECK_EQUAL(a.rows[k].*(f.second), b.rows[k].*(f.second));
            }
        }
        BOOST_REQUIRE_EQUAL(multi.monthlyTotals->size(), single.monthlyTotals->size());
        for (Size i = 0; i < single.monthlyTotals->size(); ++i) {
            const PortfolioMonthlyTotal& a = (*single.monthlyTotals)[i];
            const PortfolioMonthlyTotal& b = (*multi.monthlyTotals)[i];
            BOOST_CHECK_EQUAL(b.date, a.date);
            BOOST_CHECK_EQUAL(b.group, a.group);
            BOOST_CHECK_EQUAL(b.numberOfLoans, a.numberOfLoans);
            // worker totals are summed in a different order
            for (const auto& f : cashFlowAmountFields())
                BOOST_CHECK_CLOSE(b.*(f.second) + 1.0, a.*(f.second) + 1.0, 1e-10);
        }
    }
}

BOOST_AUTO_TEST_CASE(testWorkerTotalsMatchPortfolioTotals) {

    BOOST_TEST_MESSAGE("Testing that the reduced worker totals match totals over all loan schedules...");

    vector<LoanRecord> loans = loanrisk::test::mixedLoans(23);
    auto assumptions = loanrisk::test::baseAssumptions();
    assumptions->addTier(TierAssumption("A", 0.10, 0.02));

    CashFlowResults res = CashFlowEngine(assumptions, 5).run(loans, true, {tierKey, loanIdKey});
    BOOST_REQUIRE(res.monthlyTotals);
    vector<PortfolioMonthlyTotal> expected = CashFlowAggregator({tierKey, loanIdKey}).aggregate(res.loanCashFlows);

    BOOST_REQUIRE_EQUAL(res.monthlyTotals->size(), expected.size());
    for (Size i = 0; i < expected.size(); ++i) {
        const PortfolioMonthlyTotal& t = (*res.monthlyTotals)[i];
        BOOST_CHECK_EQUAL(t.date, expected[i].date);
        BOOST_CHECK_EQUAL(t.group, expected[i].group);
        BOOST_CHECK_EQUAL(t.numberOfLoans, expected[i].numberOfLoans);
        // one loan per group, every total has a single contribution
        BOOST_CHECK_EQUAL(t.totalPayment, expected[i].totalPayment);
        BOOST_CHECK_EQUAL(t.remainingBalance, expected[i].remainingBalance);
    }

    // without aggregation there are no totals
    BOOST_CHECK(!CashFlowEngine(assumptions, 5).run(loans, false).monthlyTotals);
}

BOOST_AUTO_TEST_CASE(testWorkerLogging) {

    BOOST_TEST_MESSAGE("Testing cash flow engine logging from worker threads...");

    auto logger = QuantLib::ext::make_shared<loanrisk::test::BoostTestLogger>();
    Log::instance().registerLogger(logger);
    Log::instance().setMask(255);
    Log::instance().switchOn();

    CashFlowResults res = CashFlowEngine(loanrisk::test::baseAssumptions(), 4).run(loanrisk::test::mixedLoans(8));
    BOOST_CHECK_EQUAL(res.loanCashFlows.size(), 8u);
    // the worker messages are written by the engine's own closing message on the test thread
    BOOST_CHECK_EQUAL(logger->pending(), 0u);
}

BOOST_AUTO_TEST_CASE(testTierResolution) {

    BOOST_TEST_MESSAGE("Testing tier resolution in the cash flow engine...");

    auto assumptions = loanrisk::test::baseAssumptions();
    assumptions->addTier(TierAssumption("A", 0.20, 0.0));
    vector<LoanRecord> loans = {LoanRecord("T1", 1000.0, 0.05, 12, snapshotDate(), "A"),
                                LoanRecord("T2", 1000.0, 0.05, 12, snapshotDate(), "Z"),
                                LoanRecord("T3", 1000.0, 0.05, 12, snapshotDate())};
    CashFlowResults res = CashFlowEngine(assumptions).run(loans, false);

    BOOST_CHECK(!res.monthlyTotals);
    BOOST_CHECK_EQUAL(res.loanCashFlows[0].resolvedTier, "A");
    BOOST_CHECK_EQUAL(res.loanCashFlows[1].resolvedTier, "default");
    BOOST_CHECK_EQUAL(res.loanCashFlows[1].tier, "Z");
    BOOST_CHECK_EQUAL(res.loanCashFlows[2].resolvedTier, "default");
    BOOST_CHECK(res.loanCashFlows[0].rows[0].prepayment > res.loanCashFlows[1].rows[0].prepayment);
}

BOOST_AUTO_TEST_CASE(testNoPartialResults) {

    BOOST_TEST_MESSAGE("Testing that invalid portfolios are rejected before any projection...");

    auto assumptions = loanrisk::test::baseAssumptions();
    vector<LoanRecord> loans = loanrisk::test::mixedLoans(10);

    vector<LoanRecord> duplicate = loans;
    duplicate.push_back(loans[3]);
    BOOST_CHECK_THROW(CashFlowEngine(assumptions, 4).run(duplicate), InvalidInputError);

    vector<LoanRecord> invalid = loans;
    invalid.push_back(LoanRecord("BAD", 1000.0, 0.05, 0, snapshotDate()));
    BOOST_CHECK_THROW(CashFlowEngine(assumptions, 4).run(invalid), InvalidInputError);

    BOOST_CHECK_THROW(CashFlowEngine(assumptions, 0), InvalidInputError);

    // an empty portfolio gives empty results
    CashFlowResults empty = CashFlowEngine(assumptions, 4).run(vector<LoanRecord>());
    BOOST_CHECK(empty.loanCashFlows.empty());
    BOOST_CHECK(empty.monthlyTotals->empty());
}

BOOST_AUTO_TEST_CASE(testPortfolioRun) {

    BOOST_TEST_MESSAGE("Testing the cash flow engine on a loan portfolio...");

    LoanPortfolio portfolio;
    for (const auto& l : loanrisk::test::threeLoans())
        portfolio.add(l);
    CashFlowResults res = CashFlowEngine(loanrisk::test::baseAssumptions(), 2).run(portfolio);
    BOOST_REQUIRE_EQUAL(res.loanCashFlows.size(), 3);
    BOOST_CHECK_EQUAL(res.loanCashFlows[1].loanId, "L2");
    BOOST_CHECK_EQUAL(res.loanCashFlows[1].rows.size(), 48);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

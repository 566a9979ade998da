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


/*! \file lra/engine/cashflowaggregator.hpp
    \brief Portfolio monthly totals of loan cash flows
    \ingroup engine
*/

#pragma once

#include <lra/engine/cashflowrow.hpp>

#include <functional>
#include <string>
#include <vector>

namespace loanrisk {
namespace analytics {

//! Maps a loan schedule to the group its rows are summed in
typedef std::function<std::string(const LoanCashFlows&)> GroupingKey;

//! Tier label of the loan, the default tier name for loans without a tier
std::string tierKey(const LoanCashFlows& flows);

//! Loan id
std::string loanIdKey(const LoanCashFlows& flows);

//! Grouping key by name, "Tier" or "LoanId"
GroupingKey parseGroupingKey(const std::string& name);

//! Cash Flow Aggregator
/*!
  Sums every numeric field of the monthly rows of all loans that share a payment date and a group. The group of a
  loan is the concatenation of its grouping keys separated by '|', or empty if no keys are given.

  The totals are ordered by ascending date, then group.

  \ingroup engine
*/
class CashFlowAggregator {
public:
    explicit CashFlowAggregator(const std::vector<GroupingKey>& keys = std::vector<GroupingKey>()) : keys_(keys) {}

    //! Totals of the given loan schedules
    std::vector<PortfolioMonthlyTotal> aggregate(const std::vector<LoanCashFlows>& flows) const;

    //! Combine partial totals, e.g. of disjoint sub portfolios, into totals of the union
    static std::vector<PortfolioMonthlyTotal> merge(const std::vector<std::vector<PortfolioMonthlyTotal>>& partials);

    //! Group key of a single loan
    std::string group(const LoanCashFlows& flows) const;

private:
    std::vector<GroupingKey> keys_;
};

} // namespace analytics
} // namespace loanrisk

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


#include <lra/engine/cashflowaggregator.hpp>
#include <lrd/configuration/assumptions.hpp>
#include <lrd/utilities/errors.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <map>

using QuantLib::Date;
using std::string;
using std::vector;

namespace loanrisk {
namespace analytics {

namespace {
typedef std::map<std::pair<Date, string>, PortfolioMonthlyTotal> TotalsMap;

void addTo(TotalsMap& totals, const Date& date, const string& group, const CashFlowAmounts& amounts,
           QuantLib::Size numberOfLoans) {
    auto it = totals.find(std::make_pair(date, group));
    if (it == totals.end()) {
        PortfolioMonthlyTotal t;
        t.date = date;
        t.group = group;
        it = totals.insert(std::make_pair(std::make_pair(date, group), t)).first;
    }
    it->second += amounts;
    it->second.numberOfLoans += numberOfLoans;
}

vector<PortfolioMonthlyTotal> toVector(const TotalsMap& totals) {
    vector<PortfolioMonthlyTotal> result;
    result.reserve(totals.size());
    for (const auto& t : totals)
        result.push_back(t.second);
    return result;
}
} // namespace

string tierKey(const LoanCashFlows& flows) {
    return flows.tier.empty() ? data::AssumptionSet::defaultTier : flows.tier;
}

string loanIdKey(const LoanCashFlows& flows) { return flows.loanId; }

GroupingKey parseGroupingKey(const string& name) {
    string s = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
    if (s == "tier")
        return tierKey;
    if (s == "loanid")
        return loanIdKey;
    LOANRISK_REQUIRE_INPUT(false, "grouping key \"" << name << "\" not recognized, expected Tier or LoanId");
    return GroupingKey();
}

string CashFlowAggregator::group(const LoanCashFlows& flows) const {
    string g;
    for (const auto& k : keys_) {
        if (!g.empty())
            g += "|";
        g += k(flows);
    }
    return g;
}

vector<PortfolioMonthlyTotal> CashFlowAggregator::aggregate(const vector<LoanCashFlows>& flows) const {
    TotalsMap totals;
    for (const auto& f : flows) {
        string g = group(f);
        for (const auto& row : f.rows)
            addTo(totals, row.date, g, row, row.startingBalance > 0.0 ? 1 : 0);
    }
    return toVector(totals);
}

vector<PortfolioMonthlyTotal> CashFlowAggregator::merge(const vector<vector<PortfolioMonthlyTotal>>& partials) {
    TotalsMap totals;
    for (const auto& p : partials) {
        for (const auto& t : p)
            addTo(totals, t.date, t.group, t, t.numberOfLoans);
    }
    return toVector(totals);
}

} // namespace analytics
} // namespace loanrisk

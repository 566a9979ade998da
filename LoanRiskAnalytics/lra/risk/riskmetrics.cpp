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


#include <lra/risk/riskmetrics.hpp>
#include <lrd/utilities/dates.hpp>
#include <lrd/utilities/errors.hpp>
#include <lrd/utilities/to_string.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <cmath>

using namespace QuantLib;
using std::vector;

namespace loanrisk {
namespace analytics {

namespace {

struct Moments {
    Real pv = 0.0, pvTime = 0.0, pvModified = 0.0, pvConvexity = 0.0;
};

Time timeOf(const LoanCashFlows& f, const MonthlyCashFlowRow& row, const Date& asOf) {
    Date origin = asOf == Date() ? f.snapshotDate : asOf;
    LOANRISK_REQUIRE_DOMAIN(row.date >= origin, "loan " << f.loanId << ": cash flow date " << data::to_string(row.date)
                                                        << " is before " << data::to_string(origin));
    return data::yearFraction(origin, row.date);
}

Moments moments(const vector<LoanCashFlows>& flows, boost::optional<Rate> discountRate, Real shift,
                const Date& asOf) {
    Moments m;
    for (const auto& f : flows) {
        Rate y = (discountRate ? *discountRate : f.rate) + shift;
        LOANRISK_REQUIRE_INPUT(1.0 + y / 12.0 > 0.0, "loan " << f.loanId << ": discount rate " << y
                                                             << " is not above -1200%");
        Real g = 1.0 + y / 12.0;
        for (const auto& row : f.rows) {
            if (row.totalPayment == 0.0)
                continue;
            Time t = timeOf(f, row, asOf);
            Real pv = row.totalPayment * std::pow(g, -12.0 * t);
            m.pv += pv;
            m.pvTime += pv * t;
            m.pvModified += pv * t / g;
            m.pvConvexity += pv * t * (t + 1.0 / 12.0) / (g * g);
        }
    }
    return m;
}

} // namespace

PrincipalField parsePrincipalField(const std::string& s) {
    std::string str = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(s));
    if (str == "total")
        return PrincipalField::Total;
    if (str == "investor")
        return PrincipalField::Investor;
    LOANRISK_REQUIRE_INPUT(false, "principal field \"" << s << "\" not recognized, expected Total or Investor");
    return PrincipalField::Total;
}

DurationResult RiskMetrics::duration(const vector<LoanCashFlows>& flows, boost::optional<Rate> discountRate,
                                     bool includeConvexity, const Date& asOf) {
    Moments m = moments(flows, discountRate, 0.0, asOf);
    LOANRISK_REQUIRE_INPUT(m.pv > 0.0, "duration: present value (" << m.pv << ") of the cash flows is not positive");
    DurationResult res;
    res.presentValue = m.pv;
    res.macaulayDuration = m.pvTime / m.pv;
    res.modifiedDuration = m.pvModified / m.pv;
    if (includeConvexity)
        res.convexity = m.pvConvexity / m.pv;
    return res;
}

Real RiskMetrics::presentValue(const vector<LoanCashFlows>& flows, boost::optional<Rate> discountRate, Real shift,
                               const Date& asOf) {
    return moments(flows, discountRate, shift, asOf).pv;
}

Real RiskMetrics::weightedAverageLife(const vector<LoanCashFlows>& flows, PrincipalField field, const Date& asOf) {
    Real weighted = 0.0, total = 0.0;
    for (const auto& f : flows) {
        for (const auto& row : f.rows) {
            Real p = field == PrincipalField::Total ? row.totalPrincipal : row.investorPrincipal;
            if (p == 0.0)
                continue;
            weighted += p * timeOf(f, row, asOf);
            total += p;
        }
    }
    LOANRISK_REQUIRE_INPUT(total > 0.0, "weighted average life: no principal cash flows");
    return weighted / total;
}

PriceChangeEstimate RiskMetrics::estimatedPriceChange(const DurationResult& result, Real shift) {
    LOANRISK_REQUIRE_INPUT(result.convexity, "estimatedPriceChange: convexity not available");
    PriceChangeEstimate e;
    e.durationOnly = -result.modifiedDuration * shift * result.presentValue;
    e.withConvexity = e.durationOnly + 0.5 * (*result.convexity) * shift * shift * result.presentValue;
    return e;
}

DurationResult computeDuration(const vector<LoanCashFlows>& flows, boost::optional<Rate> discountRate,
                               bool includeConvexity) {
    return RiskMetrics::duration(flows, discountRate, includeConvexity);
}

Real computeWal(const vector<LoanCashFlows>& flows, PrincipalField field) {
    return RiskMetrics::weightedAverageLife(flows, field);
}

} // namespace analytics
} // namespace loanrisk

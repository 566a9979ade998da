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


#include <lra/app/reportwriter.hpp>
#include <lrd/utilities/log.hpp>

using namespace QuantLib;
using std::string;
using std::vector;

namespace loanrisk {
namespace analytics {

void ReportWriter::writeLoanCashFlows(data::Report& report, const vector<LoanCashFlows>& flows) {
    LOG("Writing loan cash flow report");
    report.addColumn("LoanId", string())
        .addColumn("Tier", string())
        .addColumn("Month", Size())
        .addColumn("Date", Date());
    for (const auto& f : cashFlowAmountFields())
        report.addColumn(f.first, double(), 2);

    for (const auto& l : flows) {
        string tier = l.tier.empty() ? nullString_ : l.tier;
        for (const auto& row : l.rows) {
            report.next().add(l.loanId).add(tier).add(row.month).add(row.date);
            for (const auto& f : cashFlowAmountFields())
                report.add(row.*(f.second));
        }
    }
    report.end();
}

void ReportWriter::writeMonthlyTotals(data::Report& report, const vector<PortfolioMonthlyTotal>& totals) {
    LOG("Writing monthly totals report");
    report.addColumn("Date", Date()).addColumn("Group", string()).addColumn("NumberOfLoans", Size());
    for (const auto& f : cashFlowAmountFields())
        report.addColumn(f.first, double(), 2);

    for (const auto& t : totals) {
        report.next().add(t.date).add(t.group.empty() ? nullString_ : t.group).add(t.numberOfLoans);
        for (const auto& f : cashFlowAmountFields())
            report.add(t.*(f.second));
    }
    report.end();
}

void ReportWriter::writeRiskMetrics(data::Report& report, const boost::optional<DurationResult>& duration,
                                    const boost::optional<Real>& wal, const boost::optional<Real>& yield) {
    LOG("Writing risk metrics report");
    report.addColumn("Metric", string()).addColumn("Value", double(), 8);
    if (duration) {
        report.next().add(string("PV")).add(duration->presentValue);
        report.next().add(string("MacaulayDuration")).add(duration->macaulayDuration);
        report.next().add(string("ModifiedDuration")).add(duration->modifiedDuration);
        if (duration->convexity)
            report.next().add(string("Convexity")).add(*duration->convexity);
    }
    if (wal)
        report.next().add(string("WAL")).add(*wal);
    if (yield)
        report.next().add(string("Yield")).add(*yield);
    report.end();
}

} // namespace analytics
} // namespace loanrisk

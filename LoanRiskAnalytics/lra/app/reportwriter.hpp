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


/*! \file lra/app/reportwriter.hpp
    \brief A Class to write LoanRisk outputs to reports
    \ingroup app
*/

#pragma once

#include <lra/engine/cashflowrow.hpp>
#include <lra/risk/riskmetrics.hpp>
#include <lrd/report/report.hpp>

#include <boost/optional.hpp>

#include <string>
#include <vector>

namespace loanrisk {
namespace analytics {

//! Write LoanRisk outputs to reports
/*! \ingroup app
 */
class ReportWriter {
public:
    /*! Constructor.
        \param nullString used to represent string values that are not applicable.
    */
    ReportWriter(const std::string& nullString = "#N/A") : nullString_(nullString) {}

    virtual ~ReportWriter() {}

    //! One row per loan and month
    virtual void writeLoanCashFlows(data::Report& report, const std::vector<LoanCashFlows>& flows);

    //! One row per payment date and group
    virtual void writeMonthlyTotals(data::Report& report, const std::vector<PortfolioMonthlyTotal>& totals);

    //! Metric / value pairs, only the metrics given are written
    virtual void writeRiskMetrics(data::Report& report, const boost::optional<DurationResult>& duration,
                                  const boost::optional<QuantLib::Real>& wal,
                                  const boost::optional<QuantLib::Real>& yield);

    const std::string& nullString() const { return nullString_; }

protected:
    std::string nullString_;
};

} // namespace analytics
} // namespace loanrisk

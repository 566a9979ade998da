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


/*! \file lra/engine/cashflowengine.hpp
    \brief Multi-threaded portfolio cash flow projection
    \ingroup engine
*/

#pragma once

#include <lra/engine/amortizationengine.hpp>
#include <lra/engine/cashflowaggregator.hpp>
#include <lrd/configuration/assumptions.hpp>
#include <lrd/portfolio/loanportfolio.hpp>

#include <boost/optional.hpp>
#include <ql/shared_ptr.hpp>

#include <vector>

namespace loanrisk {
namespace analytics {

//! Loan schedules in portfolio order and, if requested, the portfolio monthly totals
/*! \ingroup engine */
struct CashFlowResults {
    std::vector<LoanCashFlows> loanCashFlows;
    boost::optional<std::vector<PortfolioMonthlyTotal>> monthlyTotals;
};

//! Cash Flow Engine
/*!
  Projects the schedules of all loans of a portfolio. Every loan and its tier resolution is validated before any
  schedule is generated, so the engine either returns the full result or throws.

  The loans are distributed round robin over nThreads worker threads, each writing into its own buffer. The
  buffers are merged back into portfolio order after all workers joined and an exception raised by a worker is
  rethrown on the calling thread. The result does not depend on the number of threads.

  \ingroup engine
*/
class CashFlowEngine {
public:
    CashFlowEngine(const QuantLib::ext::shared_ptr<data::AssumptionSet>& assumptions, QuantLib::Size nThreads = 1);

    /*! Run the projection
        \param loans         the loans, ids must be unique
        \param aggregate     if true the monthly totals are computed
        \param groupingKeys  grouping of the monthly totals, ungrouped if empty
    */
    CashFlowResults run(const std::vector<data::LoanRecord>& loans, bool aggregate = true,
                        const std::vector<GroupingKey>& groupingKeys = std::vector<GroupingKey>()) const;

    //! Run the projection for all loans of \p portfolio
    CashFlowResults run(const data::LoanPortfolio& portfolio, bool aggregate = true,
                        const std::vector<GroupingKey>& groupingKeys = std::vector<GroupingKey>()) const;

    QuantLib::Size nThreads() const { return nThreads_; }

private:
    void validate(const std::vector<data::LoanRecord>& loans) const;

    AmortizationEngine amortizationEngine_;
    QuantLib::Size nThreads_;
};

//! Cash flows of \p loans under \p assumptions
CashFlowResults computeCashFlows(const std::vector<data::LoanRecord>& loans, const data::AssumptionSet& assumptions,
                                 bool aggregate = true,
                                 const std::vector<GroupingKey>& groupingKeys = std::vector<GroupingKey>(),
                                 QuantLib::Size nThreads = 1);

} // namespace analytics
} // namespace loanrisk

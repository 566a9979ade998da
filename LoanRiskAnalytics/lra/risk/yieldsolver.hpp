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


/*! \file lra/risk/yieldsolver.hpp
    \brief Internal rate of return of a dated cash flow series
    \ingroup risk
*/

#pragma once

#include <lra/engine/cashflowrow.hpp>
#include <lrd/configuration/yieldsolverconfig.hpp>

#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <string>
#include <vector>

namespace loanrisk {
namespace analytics {

//! Dated cash flow amounts, dates need not be evenly spaced
/*! \ingroup risk */
struct CashFlowSeries {
    std::vector<QuantLib::Date> dates;
    std::vector<QuantLib::Real> amounts;

    void add(const QuantLib::Date& date, QuantLib::Real amount) {
        dates.push_back(date);
        amounts.push_back(amount);
    }
    QuantLib::Size size() const { return dates.size(); }
    bool empty() const { return dates.empty(); }
};

//! Which portfolio cash flow the effective yield is solved on
/*! \ingroup risk */
enum class CashFlowField {
    //! borrower payments, TotalPayment
    Total,
    //! investor cash flows, InvestorTotal
    Investor
};

CashFlowField parseCashFlowField(const std::string& s);

//! Outcome of a solve
/*! \ingroup risk */
struct YieldSolverResult {
    QuantLib::Rate yield = 0.0;
    //! NPV at the returned yield
    QuantLib::Real npv = 0.0;
    QuantLib::Size iterations = 0;
    //! true if the Newton phase was abandoned for bisection
    bool bisection = false;
};

//! Yield Solver
/*!
  Finds the rate \f$ r \f$ at which
  \f[ -pv + \sum_i a_i \, DF(t_i, r) = 0 \f]
  where \f$ t_i \f$ is the actual/actual (ISDA) year fraction from the start date to the i-th date and
  \f$ DF(t, r) = (1 + r/m)^{-m t} \f$ for a discrete convention with \f$ m \f$ periods per year,
  \f$ DF(t, r) = e^{-r t} \f$ for continuous compounding.

  The solver starts with Newton steps from the initial guess. It switches to bisection over
  [lowerBound, upperBound] as soon as the derivative vanishes, a value is not finite, a step leaves the bounds or
  the absolute NPV does not decrease. The iterations of both phases count against maxIterations. Convergence is
  reached when the absolute NPV or the step size falls below the accuracy.

  Errors: InvalidInputError for an empty series, pv <= 0 or all amounts zero, DomainError for a date before the
  start date, NoConvergenceError when the iterations are exhausted or the bounds do not bracket a root.

  \ingroup risk
*/
class YieldSolver {
public:
    explicit YieldSolver(const data::YieldSolverConfig& config = data::YieldSolverConfig());

    //! yield of \p series bought at \p pv on \p startDate
    QuantLib::Rate solve(const CashFlowSeries& series, QuantLib::Real pv, const QuantLib::Date& startDate,
                         data::CompoundingConvention compounding) const;

    //! as solve(), with iteration diagnostics
    YieldSolverResult solveWithDiagnostics(const CashFlowSeries& series, QuantLib::Real pv,
                                           const QuantLib::Date& startDate,
                                           data::CompoundingConvention compounding) const;

    //! Effective yield of portfolio monthly totals, groups sharing a date are summed
    QuantLib::Rate effectiveYield(const std::vector<PortfolioMonthlyTotal>& totals, QuantLib::Real pv,
                                  const QuantLib::Date& startDate, data::CompoundingConvention compounding,
                                  CashFlowField field = CashFlowField::Total) const;

    //! NPV of the series including the initial outflow \p pv at \p rate
    static QuantLib::Real npv(const CashFlowSeries& series, QuantLib::Real pv, const QuantLib::Date& startDate,
                              data::CompoundingConvention compounding, QuantLib::Rate rate);

    //! Series of the chosen field of the monthly totals, one entry per date
    static CashFlowSeries series(const std::vector<PortfolioMonthlyTotal>& totals, CashFlowField field);

    const data::YieldSolverConfig& config() const { return config_; }

private:
    data::YieldSolverConfig config_;
};

//! Yield of \p series with the given iteration limit and tolerance, default initial guess and bounds
QuantLib::Rate solveYield(const CashFlowSeries& series, QuantLib::Real pv, const QuantLib::Date& startDate,
                          data::CompoundingConvention compounding, QuantLib::Size maxIterations,
                          QuantLib::Real tolerance);

} // namespace analytics
} // namespace loanrisk

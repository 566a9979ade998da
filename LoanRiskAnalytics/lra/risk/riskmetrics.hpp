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


/*! \file lra/risk/riskmetrics.hpp
    \brief Duration, convexity and weighted average life of projected loan cash flows
    \ingroup risk
*/

#pragma once

#include <lra/engine/cashflowrow.hpp>

#include <boost/optional.hpp>
#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <string>
#include <vector>

namespace loanrisk {
namespace analytics {

//! Principal used for the weighted average life
/*! \ingroup risk */
enum class PrincipalField { Total, Investor };

PrincipalField parsePrincipalField(const std::string& s);

//! Present value and rate sensitivities of a cash flow table
/*! \ingroup risk */
struct DurationResult {
    QuantLib::Real presentValue = 0.0;
    //! years
    QuantLib::Real macaulayDuration = 0.0;
    QuantLib::Real modifiedDuration = 0.0;
    //! set if requested
    boost::optional<QuantLib::Real> convexity;
};

//! First and second order estimates of the change of the present value under a parallel rate shift
/*! \ingroup risk */
struct PriceChangeEstimate {
    //! -modified duration x shift x PV
    QuantLib::Real durationOnly = 0.0;
    //! durationOnly + 1/2 x convexity x shift^2 x PV
    QuantLib::Real withConvexity = 0.0;
};

//! Risk metrics over projected cash flows
/*!
  Time \f$ t \f$ of a row is the actual/actual (ISDA) year fraction from the snapshot date of its loan, or from
  \p asOf if given. A row dated before its time origin raises a DomainError.

  The rows' TotalPayment is discounted per loan at \f$ y \f$, the loan's rate or the override rate, with monthly
  compounding \f$ DF(t) = (1 + y/12)^{-12 t} \f$. With \f$ PV = \sum PV_t \f$ summed over all loans and months
  - Macaulay duration \f$ = \sum PV_t \, t / PV \f$
  - modified duration \f$ = \sum PV_t \, t / (1 + y/12) / PV \f$
  - convexity \f$ = \sum PV_t \, t (t + 1/12) / (1 + y/12)^2 / PV \f$

  The weighted average life is undiscounted, \f$ \sum P_t \, t / \sum P_t \f$ over the chosen principal field.

  \ingroup risk
*/
class RiskMetrics {
public:
    //! PV, durations and optionally convexity, throws InvalidInputError if the PV is not positive
    static DurationResult duration(const std::vector<LoanCashFlows>& flows,
                                   boost::optional<QuantLib::Rate> discountRate = boost::none,
                                   bool includeConvexity = true, const QuantLib::Date& asOf = QuantLib::Date());

    //! PV with every discount rate shifted by \p shift
    static QuantLib::Real presentValue(const std::vector<LoanCashFlows>& flows,
                                       boost::optional<QuantLib::Rate> discountRate = boost::none,
                                       QuantLib::Real shift = 0.0, const QuantLib::Date& asOf = QuantLib::Date());

    //! Weighted average life in years, throws InvalidInputError if there is no principal
    static QuantLib::Real weightedAverageLife(const std::vector<LoanCashFlows>& flows,
                                              PrincipalField field = PrincipalField::Total,
                                              const QuantLib::Date& asOf = QuantLib::Date());

    //! Estimated PV change under a parallel shift, requires the convexity in \p result
    static PriceChangeEstimate estimatedPriceChange(const DurationResult& result, QuantLib::Real shift);
};

//! Duration result of \p flows
DurationResult computeDuration(const std::vector<LoanCashFlows>& flows,
                               boost::optional<QuantLib::Rate> discountRate = boost::none,
                               bool includeConvexity = true);

//! Weighted average life of \p flows
QuantLib::Real computeWal(const std::vector<LoanCashFlows>& flows, PrincipalField field = PrincipalField::Total);

} // namespace analytics
} // namespace loanrisk

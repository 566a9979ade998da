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


/*! \file lra/engine/cashflowrow.hpp
    \brief Monthly cash flow records produced by the amortization engine
    \ingroup engine
*/

#pragma once

#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <string>
#include <utility>
#include <vector>

namespace loanrisk {
namespace analytics {

//! The numeric fields of one month of loan cash flows
/*! All amounts are in the loan currency for the month. The field order is the column order of the cash flow
    reports, see cashFlowAmountFields().
    \ingroup engine
*/
struct CashFlowAmounts {
    //! balance at the start of the month
    QuantLib::Real startingBalance = 0.0;
    //! balance after credit loss and prepayment, before scheduled principal
    QuantLib::Real adjustedBalance = 0.0;
    //! balance interest and fees accrue on
    QuantLib::Real accrualBalance = 0.0;
    QuantLib::Real grossInterest = 0.0;
    QuantLib::Real scheduledPrincipal = 0.0;
    QuantLib::Real prepayment = 0.0;
    QuantLib::Real creditLoss = 0.0;
    //! scheduled principal plus prepayment
    QuantLib::Real totalPrincipal = 0.0;
    QuantLib::Real remainingBalance = 0.0;
    //! cash paid by the borrower, interest plus total principal
    QuantLib::Real totalPayment = 0.0;
    QuantLib::Real servicingFee = 0.0;
    QuantLib::Real reportingFee = 0.0;
    QuantLib::Real originationFee = 0.0;
    //! gross interest net of fees (and credit loss if configured), floored at zero
    QuantLib::Real netInterest = 0.0;
    QuantLib::Real investorPrincipal = 0.0;
    QuantLib::Real investorInterest = 0.0;
    QuantLib::Real investorTotal = 0.0;
    //! unpaid interest added to the balance, non-zero only with negative amortization enabled
    QuantLib::Real capitalizedInterest = 0.0;

    CashFlowAmounts& operator+=(const CashFlowAmounts& other);
};

//! Report column names paired with the corresponding CashFlowAmounts member
const std::vector<std::pair<std::string, QuantLib::Real CashFlowAmounts::*>>& cashFlowAmountFields();

//! One month of one loan
/*! \ingroup engine */
struct MonthlyCashFlowRow : public CashFlowAmounts {
    //! 1 based month index
    QuantLib::Size month = 0;
    //! payment date of the month
    QuantLib::Date date;
};

//! The full schedule of one loan
/*! \ingroup engine */
struct LoanCashFlows {
    std::string loanId;
    //! tier label of the loan, empty if the loan has none
    std::string tier;
    //! tier whose assumptions were applied
    std::string resolvedTier;
    //! annual contract rate
    QuantLib::Rate rate = 0.0;
    QuantLib::Date snapshotDate;
    //! months 1 to term, in month order
    std::vector<MonthlyCashFlowRow> rows;
};

//! Portfolio sum of the monthly rows sharing a payment date and a group
/*! \ingroup engine */
struct PortfolioMonthlyTotal : public CashFlowAmounts {
    QuantLib::Date date;
    //! group key, empty if the totals are not grouped
    std::string group;
    //! number of loans with a positive starting balance in the month
    QuantLib::Size numberOfLoans = 0;
};

} // namespace analytics
} // namespace loanrisk

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


/*! \file lra/engine/amortizationengine.hpp
    \brief Per loan monthly cash flow schedule
    \ingroup engine
*/

#pragma once

#include <lra/engine/cashflowrow.hpp>
#include <lrd/configuration/assumptions.hpp>
#include <lrd/portfolio/loanrecord.hpp>

#include <ql/shared_ptr.hpp>

namespace loanrisk {
namespace analytics {

//! Monthly equivalent of an annual rate under compounding, 1 - (1 - annualRate)^(1/12)
QuantLib::Real annualToMonthlyRate(QuantLib::Real annualRate);

//! Level payment amortizing \p balance over \p n months at \p monthlyRate, balance / n for a zero rate
QuantLib::Real levelPayment(QuantLib::Real balance, QuantLib::Rate monthlyRate, QuantLib::Size n);

//! Amortization Engine
/*!
  Generates the schedule of months 1 to term of a single loan. Each month applies, in this order, the credit loss
  to the starting balance, the prepayment (SMM) to the remaining amount, accrues interest and fees, and pays the
  scheduled principal. Each row is derived from the previous one only.

  The level payment is the contractual payment of the loan if supplied, otherwise it is computed once from the
  snapshot balance, rate and term (AmortizationMethod::ContractualPayment) or recomputed each month from the
  adjusted balance and the remaining term (AmortizationMethod::Reamortizing). The final month pays off the
  remaining balance. Once the balance is zero the remaining rows carry zero amounts.

  \ingroup engine
*/
class AmortizationEngine {
public:
    explicit AmortizationEngine(const QuantLib::ext::shared_ptr<data::AssumptionSet>& assumptions);

    //! Schedule of \p loan with the assumptions of its tier, throws InvalidInputError for an invalid loan
    LoanCashFlows schedule(const data::LoanRecord& loan) const;

    //! Schedule of \p loan with an explicitly given tier assumption
    LoanCashFlows schedule(const data::LoanRecord& loan, const data::TierAssumption& tier) const;

    const QuantLib::ext::shared_ptr<data::AssumptionSet>& assumptions() const { return assumptions_; }

private:
    QuantLib::ext::shared_ptr<data::AssumptionSet> assumptions_;
};

} // namespace analytics
} // namespace loanrisk

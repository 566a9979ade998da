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


#include <lra/engine/amortizationengine.hpp>
#include <lrd/utilities/dates.hpp>
#include <lrd/utilities/errors.hpp>
#include <lrd/utilities/log.hpp>

#include <algorithm>
#include <cmath>

using namespace QuantLib;
using namespace loanrisk::data;

namespace loanrisk {
namespace analytics {

Real annualToMonthlyRate(Real annualRate) {
    LOANRISK_REQUIRE_INPUT(annualRate >= 0.0 && annualRate < 1.0,
                           "annual rate (" << annualRate << ") must be in [0, 1)");
    return 1.0 - std::pow(1.0 - annualRate, 1.0 / 12.0);
}

Real levelPayment(Real balance, Rate monthlyRate, Size n) {
    LOANRISK_REQUIRE_INPUT(n > 0, "levelPayment: number of months must be positive");
    if (balance <= 0.0)
        return 0.0;
    if (monthlyRate == 0.0)
        return balance / static_cast<Real>(n);
    return balance * monthlyRate / (1.0 - std::pow(1.0 + monthlyRate, -static_cast<Real>(n)));
}

AmortizationEngine::AmortizationEngine(const QuantLib::ext::shared_ptr<AssumptionSet>& assumptions)
    : assumptions_(assumptions) {
    LOANRISK_REQUIRE_INPUT(assumptions_, "AmortizationEngine: no assumption set given");
    assumptions_->check();
}

LoanCashFlows AmortizationEngine::schedule(const LoanRecord& loan) const {
    return schedule(loan, assumptions_->resolve(loan.tier()));
}

LoanCashFlows AmortizationEngine::schedule(const LoanRecord& loan, const TierAssumption& tier) const {
    loan.validate();
    tier.check();

    const AssumptionSet& a = *assumptions_;
    const Size term = static_cast<Size>(loan.term());
    const Rate r = loan.rate() / 12.0;
    const Real smm = annualToMonthlyRate(tier.cpr());
    const Real monthlyCreditCost = annualToMonthlyRate(tier.creditCost());
    const Real originationFee = loan.hasOriginalBalance()
                                    ? loan.originalBalance() * a.originationFeeRate() / static_cast<Real>(term)
                                    : 0.0;

    // contractual payment, fixed over the life unless the loan reamortizes
    Real payment = loan.hasMonthlyPayment() ? loan.monthlyPayment() : levelPayment(loan.balance(), r, term);

    LoanCashFlows result;
    result.loanId = loan.id();
    result.tier = loan.tier();
    result.resolvedTier = tier.name();
    result.rate = loan.rate();
    result.snapshotDate = loan.snapshotDate();
    result.rows.reserve(term);

    Real balance = loan.balance();
    for (Size k = 1; k <= term; ++k) {
        MonthlyCashFlowRow row;
        row.month = k;
        row.date = addMonths(loan.snapshotDate(), static_cast<Integer>(k) - 1);

        if (balance <= 0.0) {
            result.rows.push_back(row);
            continue;
        }

        row.startingBalance = balance;
        row.creditLoss = balance * monthlyCreditCost;
        row.prepayment = (balance - row.creditLoss) * smm;
        row.adjustedBalance = balance - row.creditLoss - row.prepayment;
        row.accrualBalance = a.interestOnStartingBalance() ? row.startingBalance : row.adjustedBalance;
        row.grossInterest = row.accrualBalance * r;

        if (a.amortizationMethod() == AmortizationMethod::Reamortizing && !loan.hasMonthlyPayment())
            payment = levelPayment(row.adjustedBalance, r, term - k + 1);

        if (k == term) {
            row.scheduledPrincipal = row.adjustedBalance;
        } else {
            row.scheduledPrincipal = std::min(std::max(payment - row.grossInterest, 0.0), row.adjustedBalance);
            if (a.negativeAmortization() && payment < row.grossInterest)
                row.capitalizedInterest = row.grossInterest - payment;
        }

        row.totalPrincipal = row.scheduledPrincipal + row.prepayment;
        row.remainingBalance = std::max(row.adjustedBalance - row.scheduledPrincipal + row.capitalizedInterest, 0.0);
        row.totalPayment = row.grossInterest - row.capitalizedInterest + row.totalPrincipal;

        row.servicingFee = row.accrualBalance * a.servicingFeeRate() / 12.0;
        row.reportingFee = row.accrualBalance * a.reportingFeeRate() / 12.0;
        row.originationFee = originationFee;
        Real net = row.grossInterest - row.capitalizedInterest - row.servicingFee - row.reportingFee -
                   row.originationFee - (a.creditLossReducesInterest() ? row.creditLoss : 0.0);
        row.netInterest = std::max(net, 0.0);

        row.investorPrincipal = row.totalPrincipal * a.investorShare();
        row.investorInterest = row.netInterest * a.investorShare();
        row.investorTotal = row.investorPrincipal + row.investorInterest;

        balance = row.remainingBalance;
        result.rows.push_back(row);
    }

    TLOG("Scheduled loan " << loan.id() << " with tier " << tier.name() << ", " << term << " months");
    return result;
}

} // namespace analytics
} // namespace loanrisk

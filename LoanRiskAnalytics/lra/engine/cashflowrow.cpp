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


#include <lra/engine/cashflowrow.hpp>

using QuantLib::Real;

namespace loanrisk {
namespace analytics {

CashFlowAmounts& CashFlowAmounts::operator+=(const CashFlowAmounts& other) {
    for (const auto& f : cashFlowAmountFields())
        this->*(f.second) += other.*(f.second);
    return *this;
}

const std::vector<std::pair<std::string, Real CashFlowAmounts::*>>& cashFlowAmountFields() {
    static const std::vector<std::pair<std::string, Real CashFlowAmounts::*>> fields = {
        {"StartingBalance", &CashFlowAmounts::startingBalance},
        {"AdjustedBalance", &CashFlowAmounts::adjustedBalance},
        {"AccrualBalance", &CashFlowAmounts::accrualBalance},
        {"GrossInterest", &CashFlowAmounts::grossInterest},
        {"ScheduledPrincipal", &CashFlowAmounts::scheduledPrincipal},
        {"Prepayment", &CashFlowAmounts::prepayment},
        {"CreditLoss", &CashFlowAmounts::creditLoss},
        {"TotalPrincipal", &CashFlowAmounts::totalPrincipal},
        {"RemainingBalance", &CashFlowAmounts::remainingBalance},
        {"TotalPayment", &CashFlowAmounts::totalPayment},
        {"ServicingFee", &CashFlowAmounts::servicingFee},
        {"ReportingFee", &CashFlowAmounts::reportingFee},
        {"OriginationFee", &CashFlowAmounts::originationFee},
        {"NetInterest", &CashFlowAmounts::netInterest},
        {"InvestorPrincipal", &CashFlowAmounts::investorPrincipal},
        {"InvestorInterest", &CashFlowAmounts::investorInterest},
        {"InvestorTotal", &CashFlowAmounts::investorTotal},
        {"CapitalizedInterest", &CashFlowAmounts::capitalizedInterest}};
    return fields;
}

} // namespace analytics
} // namespace loanrisk

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

#include <lrd/portfolio/loanrecord.hpp>
#include <lrd/utilities/errors.hpp>
#include <lrd/utilities/to_string.hpp>

#include <cmath>

using namespace QuantLib;
using std::string;

namespace loanrisk {
namespace data {

LoanRecord::LoanRecord(const string& id, Real balance, Rate rate, Integer term, const Date& snapshotDate,
                       const string& tier, Real monthlyPayment, Real originalBalance)
    : id_(id), balance_(balance), rate_(rate), term_(term), snapshotDate_(snapshotDate), tier_(tier),
      monthlyPayment_(monthlyPayment), originalBalance_(originalBalance) {}

void LoanRecord::validate() const {
    LOANRISK_REQUIRE_INPUT(!id_.empty(), "loan id must not be empty");
    LOANRISK_REQUIRE_INPUT(std::isfinite(balance_) && balance_ > 0.0,
                           "loan " << id_ << ": balance (" << balance_ << ") must be positive");
    LOANRISK_REQUIRE_INPUT(std::isfinite(rate_) && rate_ >= 0.0,
                           "loan " << id_ << ": rate (" << rate_ << ") must be non-negative");
    LOANRISK_REQUIRE_INPUT(term_ >= 1, "loan " << id_ << ": term (" << term_ << ") must be at least one month");
    LOANRISK_REQUIRE_INPUT(snapshotDate_ != Date(), "loan " << id_ << ": snapshot date is missing");
    if (hasMonthlyPayment()) {
        LOANRISK_REQUIRE_INPUT(monthlyPayment_ > 0.0,
                               "loan " << id_ << ": monthly payment (" << monthlyPayment_ << ") must be positive");
    }
    if (hasOriginalBalance()) {
        LOANRISK_REQUIRE_INPUT(originalBalance_ > 0.0,
                               "loan " << id_ << ": original balance (" << originalBalance_ << ") must be positive");
    }
}

std::ostream& operator<<(std::ostream& out, const LoanRecord& loan) {
    out << loan.id() << " (balance " << loan.balance() << ", rate " << loan.rate() << ", term " << loan.term()
        << "M, snapshot " << to_string(loan.snapshotDate());
    if (loan.hasTier())
        out << ", tier " << loan.tier();
    return out << ")";
}

} // namespace data
} // namespace loanrisk

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


/*! \file test/testdata.hpp
    \brief Loans and assumptions shared by the analytics tests
*/

#pragma once

#include <lrd/configuration/assumptions.hpp>
#include <lrd/portfolio/loanrecord.hpp>

#include <ql/shared_ptr.hpp>
#include <ql/time/date.hpp>
#include <ql/time/period.hpp>

#include <string>
#include <vector>

namespace loanrisk {
namespace test {

inline QuantLib::Date snapshotDate() { return QuantLib::Date(1, QuantLib::January, 2025); }

//! Three amortizing loans with a common snapshot date
inline std::vector<data::LoanRecord> threeLoans(QuantLib::Real scale = 1.0) {
    return {data::LoanRecord("L1", 25000.0 * scale, 0.0599, 60, snapshotDate()),
            data::LoanRecord("L2", 50000.0 * scale, 0.0649, 48, snapshotDate()),
            data::LoanRecord("L3", 15000.0 * scale, 0.0549, 36, snapshotDate())};
}

//! CPR 5%, credit cost 1% and a 25bp servicing fee
inline QuantLib::ext::shared_ptr<data::AssumptionSet> baseAssumptions() {
    auto a = QuantLib::ext::make_shared<data::AssumptionSet>(data::TierAssumption("default", 0.05, 0.01));
    a->servicingFeeRate() = 0.0025;
    return a;
}

//! No prepayment, no credit cost and no fees
inline QuantLib::ext::shared_ptr<data::AssumptionSet> zeroAssumptions() {
    return QuantLib::ext::make_shared<data::AssumptionSet>(data::TierAssumption("default", 0.0, 0.0));
}

//! A portfolio of n loans with varying balance, rate, term and tier
inline std::vector<data::LoanRecord> mixedLoans(QuantLib::Size n) {
    std::vector<data::LoanRecord> loans;
    const std::vector<std::string> tiers = {"A", "B", "", "C"};
    for (QuantLib::Size i = 0; i < n; ++i) {
        loans.push_back(data::LoanRecord("M" + std::to_string(i), 5000.0 + 1000.0 * static_cast<double>(i % 17),
                                         0.03 + 0.005 * static_cast<double>(i % 9),
                                         static_cast<QuantLib::Integer>(12 + (i % 5) * 12),
                                         snapshotDate() + QuantLib::Period(static_cast<QuantLib::Integer>(i % 3),
                                                                           QuantLib::Months),
                                         tiers[i % tiers.size()]));
    }
    return loans;
}

} // namespace test
} // namespace loanrisk

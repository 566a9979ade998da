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

/*! \file lrd/portfolio/loanrecord.hpp
    \brief A single loan of a portfolio snapshot
    \ingroup portfolio
*/

#pragma once

#include <ql/time/date.hpp>
#include <ql/types.hpp>
#include <ql/utilities/null.hpp>

#include <string>

namespace loanrisk {
namespace data {

//! Loan snapshot record
/*! One row of the loan tape: identifier, outstanding balance, annual rate (decimal), remaining term in months and
    the snapshot date. Tier, contractual monthly payment and original balance are optional, an empty tier or a
    \c QuantLib::Null value means not supplied.

    The constructor does not validate, validate() is called by the loaders and engines at their entry point.

    \ingroup portfolio
*/
class LoanRecord {
public:
    LoanRecord() {}
    LoanRecord(const std::string& id, QuantLib::Real balance, QuantLib::Rate rate, QuantLib::Integer term,
               const QuantLib::Date& snapshotDate, const std::string& tier = "",
               QuantLib::Real monthlyPayment = QuantLib::Null<QuantLib::Real>(),
               QuantLib::Real originalBalance = QuantLib::Null<QuantLib::Real>());

    //! \name Inspectors
    //@{
    const std::string& id() const { return id_; }
    QuantLib::Real balance() const { return balance_; }
    QuantLib::Rate rate() const { return rate_; }
    QuantLib::Integer term() const { return term_; }
    const QuantLib::Date& snapshotDate() const { return snapshotDate_; }
    const std::string& tier() const { return tier_; }
    QuantLib::Real monthlyPayment() const { return monthlyPayment_; }
    QuantLib::Real originalBalance() const { return originalBalance_; }

    bool hasTier() const { return !tier_.empty(); }
    bool hasMonthlyPayment() const { return monthlyPayment_ != QuantLib::Null<QuantLib::Real>(); }
    bool hasOriginalBalance() const { return originalBalance_ != QuantLib::Null<QuantLib::Real>(); }
    //@}

    //! Throws InvalidInputError if the record is out of domain
    /*! Requires a non-empty id, balance > 0, rate >= 0, term >= 1, a snapshot date, and when supplied a
        monthly payment > 0 and an original balance > 0.
    */
    void validate() const;

private:
    std::string id_;
    QuantLib::Real balance_ = 0.0;
    QuantLib::Rate rate_ = 0.0;
    QuantLib::Integer term_ = 0;
    QuantLib::Date snapshotDate_;
    std::string tier_;
    QuantLib::Real monthlyPayment_ = QuantLib::Null<QuantLib::Real>();
    QuantLib::Real originalBalance_ = QuantLib::Null<QuantLib::Real>();
};

std::ostream& operator<<(std::ostream& out, const LoanRecord& loan);

} // namespace data
} // namespace loanrisk

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

/*! \file lrd/portfolio/loanportfolio.hpp
    \brief Loan portfolio snapshot
    \ingroup portfolio
*/

#pragma once

#include <lrd/portfolio/loanrecord.hpp>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace loanrisk {
namespace data {

class CSVReader;

//! Loan portfolio snapshot
/*!
  Ordered collection of loans keyed by loan id. The insertion order is the portfolio order, the cash flow engine
  returns its results in this order.

  \ingroup portfolio
*/
class LoanPortfolio {
public:
    //! Default constructor
    LoanPortfolio() {}

    //! Add a loan to the portfolio, throws InvalidInputError if the loan is invalid or its id already exists
    void add(const LoanRecord& loan);
    //! Check if a loan id is already in the portfolio
    bool has(const std::string& id) const;
    //! Get the loan with the given \p id, throws if there is none
    const LoanRecord& get(const std::string& id) const;
    //! Clear the portfolio
    void clear();

    //! Portfolio size
    QuantLib::Size size() const { return loans_.size(); }
    bool empty() const { return loans_.empty(); }

    //! Loans in portfolio order
    const std::vector<LoanRecord>& loans() const { return loans_; }
    //! Build a set of loan ids
    std::set<std::string> ids() const;
    //! Build a set of all tiers referenced by the loans, loans without a tier are not represented
    std::set<std::string> tiers() const;
    //! Sum of the outstanding balances
    QuantLib::Real totalBalance() const;

    //! Load a loan snapshot CSV file
    void fromFile(const std::string& fileName);
    //! Load a loan snapshot from an in-memory CSV buffer
    void fromBuffer(const std::string& buffer);

private:
    void fromCSV(CSVReader& reader);

    std::vector<LoanRecord> loans_;
    std::map<std::string, QuantLib::Size> index_;
};

} // namespace data
} // namespace loanrisk

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

#include <lrd/portfolio/loanportfolio.hpp>
#include <lrd/utilities/csvfilereader.hpp>
#include <lrd/utilities/errors.hpp>
#include <lrd/utilities/log.hpp>
#include <lrd/utilities/parsers.hpp>

#include <boost/algorithm/string/trim.hpp>

using namespace QuantLib;
using std::string;

namespace loanrisk {
namespace data {

namespace {
const std::vector<string> requiredColumns = {"LoanId", "Balance", "Rate", "Term", "SnapshotDate"};

string optionalField(const CSVReader& reader, const string& field) {
    return reader.hasField(field) ? boost::algorithm::trim_copy(reader.get(field)) : string();
}

Real optionalReal(const CSVReader& reader, const string& field) {
    string s = optionalField(reader, field);
    return s.empty() ? Null<Real>() : parseReal(s);
}
} // namespace

void LoanPortfolio::add(const LoanRecord& loan) {
    loan.validate();
    LOANRISK_REQUIRE_INPUT(!has(loan.id()), "Attempted to add a loan to the portfolio with an id, which already "
                                            "exists: "
                                                << loan.id());
    index_[loan.id()] = loans_.size();
    loans_.push_back(loan);
}

bool LoanPortfolio::has(const string& id) const { return index_.find(id) != index_.end(); }

const LoanRecord& LoanPortfolio::get(const string& id) const {
    auto it = index_.find(id);
    LOANRISK_REQUIRE_INPUT(it != index_.end(), "loan " << id << " not found in portfolio");
    return loans_[it->second];
}

void LoanPortfolio::clear() {
    loans_.clear();
    index_.clear();
}

std::set<string> LoanPortfolio::ids() const {
    std::set<string> ids;
    for (const auto& l : loans_)
        ids.insert(l.id());
    return ids;
}

std::set<string> LoanPortfolio::tiers() const {
    std::set<string> tiers;
    for (const auto& l : loans_) {
        if (l.hasTier())
            tiers.insert(l.tier());
    }
    return tiers;
}

Real LoanPortfolio::totalBalance() const {
    Real sum = 0.0;
    for (const auto& l : loans_)
        sum += l.balance();
    return sum;
}

void LoanPortfolio::fromFile(const string& fileName) {
    LOG("Loading loan portfolio from file " << fileName);
    CSVFileReader reader(fileName, true);
    fromCSV(reader);
    reader.close();
}

void LoanPortfolio::fromBuffer(const string& buffer) {
    CSVBufferReader reader(buffer, true);
    fromCSV(reader);
}

void LoanPortfolio::fromCSV(CSVReader& reader) {
    for (const auto& c : requiredColumns) {
        LOANRISK_REQUIRE_INPUT(reader.hasField(c), "loan portfolio: required column '" << c << "' not found");
    }
    while (reader.next()) {
        string id = boost::algorithm::trim_copy(reader.get("LoanId"));
        try {
            LoanRecord loan(id, parseReal(reader.get("Balance")), parseReal(reader.get("Rate")),
                            parseInteger(reader.get("Term")), parseDate(reader.get("SnapshotDate")),
                            optionalField(reader, "Tier"), optionalReal(reader, "MonthlyPayment"),
                            optionalReal(reader, "OriginalBalance"));
            add(loan);
            TLOG("Loaded loan " << loan);
        } catch (const QuantLib::Error& e) {
            StructuredMessage(StructuredMessage::Category::Error, StructuredMessage::Group::Portfolio, e.what(),
                              {{"loanId", id}, {"line", std::to_string(reader.currentLine())}})
                .log();
            throw;
        }
    }
    LOG("Loaded " << loans_.size() << " loans, total balance " << totalBalance());
}

} // namespace data
} // namespace loanrisk

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


#include <lrd/report/csvreport.hpp>
#include <lrd/report/inmemoryreport.hpp>

#include <ql/errors.hpp>

#include <algorithm>

namespace loanrisk {
namespace data {

Report& InMemoryReport::addColumn(const string& name, const ReportType& rt, Size precision) {
    QL_REQUIRE(rows() == 0, "Cannot add column " << name << " after rows were added");
    QL_REQUIRE(!hasHeader(name), "report already has a column " << name);
    columns_.push_back(Column{name, rt, precision, vector<ReportType>()});
    cursor_ = columns_.size();
    return *this;
}

Report& InMemoryReport::next() {
    QL_REQUIRE(cursor_ == columns_.size(), "Cannot go to next line, only " << cursor_ << " entries filled, report "
                                                                           << "headers are: " << headerList());
    cursor_ = 0;
    return *this;
}

Report& InMemoryReport::add(const ReportType& rt) {
    QL_REQUIRE(cursor_ < columns_.size(), "No column to add [" << rt << "] to.");
    Column& c = columns_[cursor_];
    QL_REQUIRE(rt.which() == c.type.which(), "Cannot add value " << rt << " of type " << rt.which() << " to column "
                                                                 << c.name << " of type " << c.type.which());
    c.values.push_back(rt);
    ++cursor_;
    return *this;
}

void InMemoryReport::end() {
    QL_REQUIRE(cursor_ == columns_.size() || cursor_ == 0, "report is finalized with incomplete row, got data for "
                                               << cursor_ << " columns out of " << columns() << ", report headers are: "
                                               << headerList());
}

bool InMemoryReport::hasHeader(const string& h) const {
    return std::any_of(columns_.begin(), columns_.end(), [&h](const Column& c) { return c.name == h; });
}

Size InMemoryReport::columnIndex(const string& h) const {
    for (Size i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == h)
            return i;
    }
    QL_FAIL("report has no column " << h << ", report headers are: " << headerList());
}

const Report::ReportType& InMemoryReport::data(Size i, Size j) const {
    const Column& c = column(i);
    QL_REQUIRE(j < c.values.size(), "report row index " << j << " out of range for column " << c.name);
    return c.values[j];
}

const InMemoryReport::Column& InMemoryReport::column(Size i) const {
    QL_REQUIRE(i < columns_.size(), "report column index " << i << " out of range [0, " << columns_.size() << ")");
    return columns_[i];
}

string InMemoryReport::headerList() const {
    string s;
    for (const auto& c : columns_)
        s += (s.empty() ? "" : ",") + c.name;
    return s;
}

void InMemoryReport::writeTo(Report& report) const {
    for (const auto& c : columns_)
        report.addColumn(c.name, c.type, c.precision);
    for (Size j = 0; j < rows(); ++j) {
        report.next();
        for (const auto& c : columns_)
            report.add(c.values[j]);
    }
    report.end();
}

void InMemoryReport::toFile(const string& filename, const char sep, const bool commentCharacter, char quoteChar,
                            const string& nullString) const {
    CSVFileReport report(filename, sep, commentCharacter, quoteChar, nullString);
    writeTo(report);
}

} // namespace data
} // namespace loanrisk

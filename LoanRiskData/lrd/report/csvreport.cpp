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
#include <lrd/utilities/log.hpp>
#include <lrd/utilities/to_string.hpp>

#include <boost/variant/static_visitor.hpp>
#include <ql/errors.hpp>
#include <ql/math/comparison.hpp>
#include <ql/math/rounding.hpp>
#include <ql/utilities/null.hpp>

#include <cmath>
#include <iomanip>
#include <sstream>

using std::string;

namespace loanrisk {
namespace data {

namespace {

// text of one cell, Null values are rendered as the null string
class CellFormatter : public boost::static_visitor<string> {
public:
    CellFormatter(Size precision, const string& nullString) : precision_(precision), null_(nullString) {}

    string operator()(const Size i) const { return i == QuantLib::Null<Size>() ? null_ : std::to_string(i); }
    string operator()(const Real d) const {
        if (d == QuantLib::Null<Real>() || !std::isfinite(d))
            return null_;
        QuantLib::Rounding rounding(static_cast<QuantLib::Integer>(precision_), QuantLib::Rounding::Closest);
        Real r = rounding(d);
        std::ostringstream os;
        os << std::fixed << std::setprecision(static_cast<int>(precision_))
           << (QuantLib::close_enough(r, 0.0) ? 0.0 : r);
        return os.str();
    }
    string operator()(const string& s) const { return s; }
    string operator()(const Date& d) const { return d == Date() ? null_ : to_string(d); }

private:
    Size precision_;
    const string& null_;
};

bool isText(const Report::ReportType& rt) { return rt.which() == 2 || rt.which() == 3; }

} // namespace

CSVFileReport::CSVFileReport(const string& filename, const char sep, const bool commentCharacter, char quoteChar,
                             const string& nullString)
    : filename_(filename), sep_(sep), commentCharacter_(commentCharacter), quoteChar_(quoteChar),
      nullString_(nullString), out_(filename) {
    QL_REQUIRE(out_.is_open(), "Error opening file '" << filename_ << "'");
    LOG("Opened CSV file report '" << filename_ << "'");
}

CSVFileReport::~CSVFileReport() {
    if (!finalized_)
        WLOG("CSV file report '" << filename_ << "' was not finalized, call end() on the report instance.");
}

void CSVFileReport::flush() {
    require("flush()");
    out_.flush();
}

Report& CSVFileReport::addColumn(const string& name, const ReportType& rt, Size precision) {
    require("addColumn(" + name + ")");
    QL_REQUIRE(!headerWritten_, "CSV file report '" << filename_ << "': column " << name
                                                    << " can not be added after the first row");
    columns_.push_back(Column{name, rt, precision});
    return *this;
}

Report& CSVFileReport::next() {
    require("next()");
    writeHeader();
    if (rowOpen_)
        writeRow();
    rowOpen_ = true;
    return *this;
}

Report& CSVFileReport::add(const ReportType& rt) {
    require("add()");
    QL_REQUIRE(rowOpen_, "CSV file report '" << filename_ << "': call next() before add()");
    QL_REQUIRE(row_.size() < columns_.size(), "No column to add [" << rt << "] to.");
    const Column& c = columns_[row_.size()];
    QL_REQUIRE(rt.which() == c.type.which(), "Cannot add value " << rt << " of type " << rt.which() << " to column "
                                                                 << c.name << " of type " << c.type.which());
    string cell = boost::apply_visitor(CellFormatter(c.precision, nullString_), rt);
    row_.push_back(isText(rt) && cell != nullString_ ? quote(cell) : cell);
    return *this;
}

void CSVFileReport::end() {
    require("end()");
    QL_REQUIRE(row_.empty() || row_.size() == columns_.size(),
               "csv report is finalized with incomplete row, got data for " << row_.size() << " columns out of "
                                                                            << columns_.size());
    writeHeader();
    if (rowOpen_ && !row_.empty())
        writeRow();
    rowOpen_ = false;
    finalized_ = true;
    out_.close();
    QL_REQUIRE(!out_.fail(), "CSV file report '" << filename_ << "' could not be written");
    LOG("CSV file report '" << filename_ << "' closed.");
}

void CSVFileReport::require(const string& op) const {
    QL_REQUIRE(!finalized_,
               "CSV file report '" << filename_ << "' is already finalized, can not process operation " << op);
}

void CSVFileReport::writeHeader() {
    if (headerWritten_)
        return;
    if (commentCharacter_)
        out_ << '#';
    for (Size i = 0; i < columns_.size(); ++i)
        out_ << (i == 0 ? "" : string(1, sep_)) << quote(columns_[i].name);
    out_ << '\n';
    headerWritten_ = true;
}

void CSVFileReport::writeRow() {
    QL_REQUIRE(row_.size() == columns_.size(),
               "Cannot go to next line, only " << row_.size() << " of " << columns_.size() << " entries filled");
    for (Size i = 0; i < row_.size(); ++i)
        out_ << (i == 0 ? "" : string(1, sep_)) << row_[i];
    out_ << '\n';
    row_.clear();
}

string CSVFileReport::quote(const string& s) const {
    char q = quoteChar_;
    if (q == '\0') {
        if (s.find_first_of(string(1, sep_) + "\"\r\n") == string::npos)
            return s;
        q = '"';
    }
    string quoted(1, q);
    for (char c : s) {
        if (c == q)
            quoted += q;
        quoted += c;
    }
    quoted += q;
    return quoted;
}

} // namespace data
} // namespace loanrisk

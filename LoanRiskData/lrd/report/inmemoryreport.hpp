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


/*! \file lrd/report/inmemoryreport.hpp
    \brief Report kept in memory, column by column
    \ingroup report
*/

#pragma once

#include <lrd/report/report.hpp>

#include <vector>

namespace loanrisk {
namespace data {
using std::string;
using std::vector;

//! Report kept in memory
/*! The application keeps its results in this form, tests inspect them through the accessors and writeTo()
    replays the report into any other Report, toFile() into a CSVFileReport.
    \ingroup report
 */
class InMemoryReport : public Report {
public:
    InMemoryReport() {}

    Report& addColumn(const string& name, const ReportType& rt, Size precision = 0) override;
    Report& next() override;
    Report& add(const ReportType& rt) override;
    void end() override;

    //! \name Inspectors
    //@{
    Size columns() const { return columns_.size(); }
    Size rows() const { return columns_.empty() ? 0 : columns_.front().values.size(); }
    const string& header(Size i) const { return column(i).name; }
    bool hasHeader(const string& h) const;
    //! Index of the column with header \p h, throws if there is none
    Size columnIndex(const string& h) const;
    ReportType columnType(Size i) const { return column(i).type; }
    Size columnPrecision(Size i) const { return column(i).precision; }
    //! values of column \p i
    const vector<ReportType>& data(Size i) const { return column(i).values; }
    //! value in column \p i, row \p j
    const ReportType& data(Size i, Size j) const;
    //@}

    //! Add the columns and rows of this report to \p report and finalize it
    void writeTo(Report& report) const;
    //! Write the report to a csv file
    void toFile(const string& filename, const char sep = ',', const bool commentCharacter = true, char quoteChar = '\0',
                const string& nullString = "#N/A") const;

private:
    struct Column {
        string name;
        ReportType type;
        Size precision;
        vector<ReportType> values;
    };
    const Column& column(Size i) const;
    string headerList() const;

    vector<Column> columns_;
    // next column to fill in the current row
    Size cursor_ = 0;
};

} // namespace data
} // namespace loanrisk

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


/*! \file lrd/report/csvreport.hpp
    \brief Report written to a delimited text file
    \ingroup report
*/

#pragma once

#include <lrd/report/report.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace loanrisk {
namespace data {

//! Report written to a CSV file
/*! The header line is written with the first row, prefixed with \c # unless disabled. Rows are written when
    complete, Real columns are rounded to the precision of their column. Strings containing the separator, a quote
    or a line break are quoted even if no quote character is configured.

    \ingroup report
*/
class CSVFileReport : public Report {
public:
    /*! Create the file, throws if it cannot be opened.
        \param filename         name of the csv file that is created
        \param sep              field separator
        \param commentCharacter if \c true, the header line starts with \c #
        \param quoteChar        character to quote every string with, \c '\\0' for none
        \param nullString       written for Null and non-finite values
    */
    CSVFileReport(const string& filename, const char sep = ',', const bool commentCharacter = true,
                  char quoteChar = '\0', const std::string& nullString = "#N/A");
    ~CSVFileReport();

    Report& addColumn(const string& name, const ReportType& rt, Size precision = 0) override;
    Report& next() override;
    Report& add(const ReportType& rt) override;
    void end() override;
    void flush() override;

    const std::string& filename() const { return filename_; }

private:
    struct Column {
        string name;
        ReportType type;
        Size precision;
    };

    void require(const std::string& op) const;
    void writeHeader();
    void writeRow();
    std::string format(const ReportType& rt, Size precision) const;
    std::string quote(const std::string& s) const;

    std::string filename_;
    char sep_;
    bool commentCharacter_;
    char quoteChar_;
    std::string nullString_;

    std::vector<Column> columns_;
    std::vector<std::string> row_;
    bool headerWritten_ = false;
    bool rowOpen_ = false;
    bool finalized_ = false;
    std::ofstream out_;
};

} // namespace data
} // namespace loanrisk

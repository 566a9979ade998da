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


/*! \file lrd/report/report.hpp
    \brief Tabular output interface
    \ingroup report
*/

#pragma once

#include <boost/variant.hpp>
#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <string>

namespace loanrisk {
namespace data {
using QuantLib::Date;
using QuantLib::Real;
using QuantLib::Size;
using std::string;

//! Tabular output
/*! Columns are declared first, each with a name, a type given by a sample value and a precision for Real columns.
    Rows are then filled cell by cell, every cell must match the type of its column:
    <pre>
     report.addColumn("LoanId", string()).addColumn("Month", Size()).addColumn("TotalPayment", Real(), 2);
     report.next().add(string("L1")).add(Size(1)).add(483.20);
     report.next().add(string("L1")).add(Size(2)).add(483.20);
     report.end();
    </pre>
    \ingroup report
*/
class Report {
public:
    //! cell value, Null<Size>, Null<Real> and Date() are written as null values
    typedef boost::variant<Size, Real, string, Date> ReportType;

    virtual ~Report() {}

    virtual Report& addColumn(const string& name, const ReportType& rt, Size precision = 0) = 0;
    //! start a new row, the previous one must be complete
    virtual Report& next() = 0;
    virtual Report& add(const ReportType& rt) = 0;
    //! finalize, no further calls are allowed
    virtual void end() = 0;
    //! write buffered output to its destination
    virtual void flush() {}
};

} // namespace data
} // namespace loanrisk

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

/*! \file lrd/utilities/dates.hpp
    \brief Day count and month arithmetic helpers
    \ingroup utilities
*/

#pragma once

#include <ql/time/date.hpp>
#include <ql/time/daycounter.hpp>
#include <ql/types.hpp>

namespace loanrisk {
namespace data {

//! The day counter used throughout for time measurement, Actual/Actual (ISDA)
/*! Spans crossing a calendar year boundary are prorated over the days of each year, so a leap year
    contributes 1/366 per day and a common year 1/365.
    \ingroup utilities
*/
const QuantLib::DayCounter& actualActual();

//! Year fraction between two dates under Actual/Actual (ISDA)
QuantLib::Time yearFraction(const QuantLib::Date& start, const QuantLib::Date& end);

//! Calendar date \p months months after \p date, the day is clamped to the end of the target month
QuantLib::Date addMonths(const QuantLib::Date& date, QuantLib::Integer months);

} // namespace data
} // namespace loanrisk

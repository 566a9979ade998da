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

#include <lrd/utilities/dates.hpp>
#include <lrd/utilities/errors.hpp>

#include <ql/time/daycounters/actualactual.hpp>
#include <ql/time/period.hpp>

using namespace QuantLib;

namespace loanrisk {
namespace data {

const DayCounter& actualActual() {
    static const DayCounter dc = ActualActual(ActualActual::ISDA);
    return dc;
}

Time yearFraction(const Date& start, const Date& end) {
    LOANRISK_REQUIRE_INPUT(start != Date() && end != Date(), "yearFraction: null date given");
    return actualActual().yearFraction(start, end);
}

Date addMonths(const Date& date, Integer months) {
    LOANRISK_REQUIRE_INPUT(date != Date(), "addMonths: null date given");
    // QuantLib's month arithmetic clamps the day to the last day of the target month
    return date + Period(months, Months);
}

} // namespace data
} // namespace loanrisk

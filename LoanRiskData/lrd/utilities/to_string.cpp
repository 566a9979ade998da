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

#include <lrd/utilities/to_string.hpp>

namespace loanrisk {
namespace data {

std::string to_string(const QuantLib::Date& date) {
    if (date == QuantLib::Date())
        return std::string();
    std::ostringstream oss;
    oss << QuantLib::io::iso_date(date);
    return oss.str();
}

std::string to_string(bool aBool) { return aBool ? "true" : "false"; }

} // namespace data
} // namespace loanrisk

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

/*! \file lrd/utilities/to_string.hpp
    \brief string conversion utilities
    \ingroup utilities
*/

#pragma once

#include <ql/time/date.hpp>

#include <sstream>
#include <string>

namespace loanrisk {
namespace data {

/*! Convert a QuantLib::Date to a std::string in the ISO format yyyy-mm-dd
    \ingroup utilities
*/
std::string to_string(const QuantLib::Date& date);

/*! Convert bool to std::string
    \ingroup utilities
*/
std::string to_string(bool aBool);

/*! Convert type to std::string
    \ingroup utilities
*/
template <class T> std::string to_string(const T& t) {
    std::ostringstream oss;
    oss.precision(16);
    oss << t;
    return oss.str();
}

} // namespace data
} // namespace loanrisk

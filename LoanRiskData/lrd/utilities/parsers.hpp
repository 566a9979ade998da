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

/*! \file lrd/utilities/parsers.hpp
    \brief String conversion utilities
    \ingroup utilities
*/

#pragma once

#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <functional>
#include <string>
#include <vector>

namespace loanrisk {
namespace data {

/*! Convert text to QuantLib::Date
    \ingroup utilities

    Accepted formats are yyyy-mm-dd and yyyymmdd. Throws InvalidInputError otherwise.
*/
QuantLib::Date parseDate(const std::string& s);

//! Convert text to Real
/*!
  \ingroup utilities
*/
QuantLib::Real parseReal(const std::string& s);

//! Attempt to convert text to Real
/*! Attempts to convert text to Real
    \param[in]  s      The string we wish to convert to a Real
    \param[out] result The result of the conversion if it is valid.
                       Null<Real>() if conversion fails

    \return True if the conversion was successful, False if not

    \ingroup utilities
*/
bool tryParseReal(const std::string& s, QuantLib::Real& result);

//! Convert text to QuantLib::Integer
/*!
  \ingroup utilities
*/
QuantLib::Integer parseInteger(const std::string& s);

//! Convert text to bool
/*!
  Accepts Y, YES, TRUE, true, 1 and their negative counterparts.
  \ingroup utilities
*/
bool parseBool(const std::string& s);

//! Convert comma separated list of values to vector of values, empty entries are dropped
/*!
  \ingroup utilities
*/
std::vector<std::string> parseListOfValues(std::string s);

//! Convert comma separated list of values to vector of values using the given element parser
template <class T>
std::vector<T> parseListOfValues(const std::string& s, std::function<T(const std::string&)> parser) {
    std::vector<T> vec;
    for (const auto& t : parseListOfValues(s))
        vec.push_back(parser(t));
    return vec;
}

} // namespace data
} // namespace loanrisk

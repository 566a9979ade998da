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

/*! \file lrd/utilities/errors.hpp
    \brief Error classes raised by the cash flow and risk engines
    \ingroup utilities
*/

#pragma once

#include <ql/errors.hpp>

#include <sstream>
#include <string>

namespace loanrisk {
namespace data {

//! Malformed or out-of-domain input record or configuration field
/*! \ingroup utilities */
class InvalidInputError : public QuantLib::Error {
public:
    InvalidInputError(const std::string& file, long line, const std::string& functionName,
                      const std::string& message = "")
        : QuantLib::Error(file, line, functionName, message) {}
};

//! Iterative solver exhausted its iterations without meeting the tolerance
/*! \ingroup utilities */
class NoConvergenceError : public QuantLib::Error {
public:
    NoConvergenceError(const std::string& file, long line, const std::string& functionName,
                       const std::string& message = "")
        : QuantLib::Error(file, line, functionName, message) {}
};

//! Input that is well formed but outside the domain of a computation, e.g. a cash flow before the start date
/*! \ingroup utilities */
class DomainError : public QuantLib::Error {
public:
    DomainError(const std::string& file, long line, const std::string& functionName, const std::string& message = "")
        : QuantLib::Error(file, line, functionName, message) {}
};

} // namespace data
} // namespace loanrisk

/*! throw a loanrisk::data::InvalidInputError with the given message unless the condition holds */
#define LOANRISK_REQUIRE_INPUT(condition, message)                                                                    \
    do {                                                                                                               \
        if (!(condition)) {                                                                                            \
            std::ostringstream _lr_msg_stream;                                                                         \
            _lr_msg_stream << message;                                                                                 \
            throw loanrisk::data::InvalidInputError(__FILE__, __LINE__, QL_PRETTY_FUNCTION, _lr_msg_stream.str());    \
        }                                                                                                              \
    } while (false)

/*! throw a loanrisk::data::DomainError with the given message unless the condition holds */
#define LOANRISK_REQUIRE_DOMAIN(condition, message)                                                                   \
    do {                                                                                                               \
        if (!(condition)) {                                                                                            \
            std::ostringstream _lr_msg_stream;                                                                         \
            _lr_msg_stream << message;                                                                                 \
            throw loanrisk::data::DomainError(__FILE__, __LINE__, QL_PRETTY_FUNCTION, _lr_msg_stream.str());          \
        }                                                                                                              \
    } while (false)

/*! throw a loanrisk::data::NoConvergenceError with the given message */
#define LOANRISK_FAIL_NO_CONVERGENCE(message)                                                                         \
    do {                                                                                                               \
        std::ostringstream _lr_msg_stream;                                                                             \
        _lr_msg_stream << message;                                                                                     \
        throw loanrisk::data::NoConvergenceError(__FILE__, __LINE__, QL_PRETTY_FUNCTION, _lr_msg_stream.str());       \
    } while (false)

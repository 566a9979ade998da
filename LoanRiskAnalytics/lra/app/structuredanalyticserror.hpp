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


/*! \file lra/app/structuredanalyticserror.hpp
    \brief Structured analytics error
    \ingroup app
*/

#pragma once

#include <lrd/utilities/log.hpp>

#include <exception>

namespace loanrisk {
namespace analytics {

//! Error raised while running an analytic, logged as a structured message
/*! The sub fields carry the analytic and the error class, i.e. InvalidInput, NoConvergence, DomainError or Error.
    \ingroup app
*/
class StructuredAnalyticsErrorMessage : public loanrisk::data::StructuredMessage {
public:
    StructuredAnalyticsErrorMessage(const std::string& analyticType, const std::string& exceptionType,
                                    const std::string& exceptionWhat,
                                    const std::map<std::string, std::string>& subFields = {});

    //! Error class derived from the dynamic type of \p e
    StructuredAnalyticsErrorMessage(const std::string& analyticType, const std::exception& e,
                                    const std::map<std::string, std::string>& subFields = {});

    //! Name of the error class of \p e
    static std::string errorType(const std::exception& e);
};

} // namespace analytics
} // namespace loanrisk

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


#include <lra/app/structuredanalyticserror.hpp>
#include <lrd/utilities/errors.hpp>

namespace loanrisk {
namespace analytics {

StructuredAnalyticsErrorMessage::StructuredAnalyticsErrorMessage(const std::string& analyticType,
                                                                 const std::string& exceptionType,
                                                                 const std::string& exceptionWhat,
                                                                 const std::map<std::string, std::string>& subFields)
    : StructuredMessage(Category::Error, Group::Analytics, exceptionWhat,
                        {{"exceptionType", exceptionType}, {"analyticType", analyticType}}) {
    subFields_.insert(subFields.begin(), subFields.end());
}

StructuredAnalyticsErrorMessage::StructuredAnalyticsErrorMessage(const std::string& analyticType,
                                                                 const std::exception& e,
                                                                 const std::map<std::string, std::string>& subFields)
    : StructuredAnalyticsErrorMessage(analyticType, errorType(e), e.what(), subFields) {}

std::string StructuredAnalyticsErrorMessage::errorType(const std::exception& e) {
    if (dynamic_cast<const data::InvalidInputError*>(&e))
        return "InvalidInput";
    if (dynamic_cast<const data::NoConvergenceError*>(&e))
        return "NoConvergence";
    if (dynamic_cast<const data::DomainError*>(&e))
        return "DomainError";
    return "Error";
}

} // namespace analytics
} // namespace loanrisk

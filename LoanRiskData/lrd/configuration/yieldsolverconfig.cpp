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

#include <lrd/configuration/yieldsolverconfig.hpp>
#include <lrd/utilities/errors.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <map>

using namespace QuantLib;
using std::string;

namespace loanrisk {
namespace data {

Size periodsPerYear(CompoundingConvention c) {
    switch (c) {
    case CompoundingConvention::Monthly:
        return 12;
    case CompoundingConvention::Quarterly:
        return 4;
    case CompoundingConvention::Semiannual:
        return 2;
    case CompoundingConvention::Annual:
        return 1;
    default:
        LOANRISK_REQUIRE_INPUT(false, "compounding convention " << c << " has no discrete frequency");
    }
    return 0;
}

CompoundingConvention parseCompoundingConvention(const string& s) {
    static const std::map<string, CompoundingConvention> m = {
        {"monthly", CompoundingConvention::Monthly},       {"quarterly", CompoundingConvention::Quarterly},
        {"semiannual", CompoundingConvention::Semiannual}, {"semi-annual", CompoundingConvention::Semiannual},
        {"annual", CompoundingConvention::Annual},         {"continuous", CompoundingConvention::Continuous}};
    auto it = m.find(boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(s)));
    LOANRISK_REQUIRE_INPUT(it != m.end(), "Compounding convention \"" << s << "\" not recognized");
    return it->second;
}

std::ostream& operator<<(std::ostream& out, CompoundingConvention c) {
    switch (c) {
    case CompoundingConvention::Monthly:
        return out << "Monthly";
    case CompoundingConvention::Quarterly:
        return out << "Quarterly";
    case CompoundingConvention::Semiannual:
        return out << "Semiannual";
    case CompoundingConvention::Annual:
        return out << "Annual";
    case CompoundingConvention::Continuous:
        return out << "Continuous";
    default:
        return out << "Unknown";
    }
}

YieldSolverConfig::YieldSolverConfig(Size maxIterations, Real accuracy, Real initialGuess, Real lowerBound,
                                     Real upperBound)
    : maxIterations_(maxIterations), accuracy_(accuracy), initialGuess_(initialGuess), lowerBound_(lowerBound),
      upperBound_(upperBound) {
    check();
}

void YieldSolverConfig::fromXML(XMLNode* node) {

    XMLUtils::checkNode(node, "YieldSolverConfig");

    int maxIterations = XMLUtils::getChildValueAsInt(node, "MaxIterations", false, 100);
    LOANRISK_REQUIRE_INPUT(maxIterations > 0, "MaxIterations (" << maxIterations << ") should be positive.");
    maxIterations_ = static_cast<Size>(maxIterations);
    accuracy_ = XMLUtils::getChildValueAsDouble(node, "Accuracy", false, 1.0e-10);
    initialGuess_ = XMLUtils::getChildValueAsDouble(node, "InitialGuess", false, 0.10);
    lowerBound_ = XMLUtils::getChildValueAsDouble(node, "LowerBound", false, -0.99);
    upperBound_ = XMLUtils::getChildValueAsDouble(node, "UpperBound", false, 10.0);

    check();
}

XMLNode* YieldSolverConfig::toXML(XMLDocument& doc) const {

    XMLNode* node = doc.allocNode("YieldSolverConfig");

    XMLUtils::addChild(doc, node, "MaxIterations", static_cast<int>(maxIterations_));
    XMLUtils::addChild(doc, node, "Accuracy", accuracy_);
    XMLUtils::addChild(doc, node, "InitialGuess", initialGuess_);
    XMLUtils::addChild(doc, node, "LowerBound", lowerBound_);
    XMLUtils::addChild(doc, node, "UpperBound", upperBound_);

    return node;
}

void YieldSolverConfig::check() const {
    LOANRISK_REQUIRE_INPUT(maxIterations_ > 0, "MaxIterations (" << maxIterations_ << ") should be positive.");
    LOANRISK_REQUIRE_INPUT(accuracy_ > 0.0, "Accuracy (" << accuracy_ << ") should be positive.");
    LOANRISK_REQUIRE_INPUT(lowerBound_ > -1.0, "LowerBound (" << lowerBound_ << ") should be greater than -100%.");
    LOANRISK_REQUIRE_INPUT(lowerBound_ < upperBound_, "LowerBound (" << lowerBound_
                                                                     << ") should be less than UpperBound ("
                                                                     << upperBound_ << ").");
    LOANRISK_REQUIRE_INPUT(initialGuess_ > lowerBound_ && initialGuess_ < upperBound_,
                           "InitialGuess (" << initialGuess_ << ") should lie in (" << lowerBound_ << ", "
                                            << upperBound_ << ").");
}

} // namespace data
} // namespace loanrisk

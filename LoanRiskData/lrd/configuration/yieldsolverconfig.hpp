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

/*! \file lrd/configuration/yieldsolverconfig.hpp
    \brief Class for holding the yield solver configuration
    \ingroup configuration
*/

#pragma once

#include <lrd/utilities/xmlutils.hpp>

#include <ql/types.hpp>

#include <ostream>
#include <string>

namespace loanrisk {
namespace data {

//! Compounding convention of a solved yield
/*! \ingroup configuration */
enum class CompoundingConvention { Monthly, Quarterly, Semiannual, Annual, Continuous };

//! Periods per year of a discrete convention, throws for Continuous
QuantLib::Size periodsPerYear(CompoundingConvention c);

//! Convert text to CompoundingConvention, accepts e.g. "Monthly", "Quarterly", "Semiannual", "Annual", "Continuous"
CompoundingConvention parseCompoundingConvention(const std::string& s);

std::ostream& operator<<(std::ostream& out, CompoundingConvention c);

/*! Serializable yield solver configuration

    Iteration limit, tolerance, Newton starting point and the bracket searched by the bisection phase.
    \ingroup configuration
*/
class YieldSolverConfig : public XMLSerializable {
public:
    //! Constructor, the defaults are 100 iterations, accuracy 1e-10, initial guess 10% and the bracket [-99%, 1000%]
    explicit YieldSolverConfig(QuantLib::Size maxIterations = 100, QuantLib::Real accuracy = 1.0e-10,
                               QuantLib::Real initialGuess = 0.10, QuantLib::Real lowerBound = -0.99,
                               QuantLib::Real upperBound = 10.0);

    //! \name XMLSerializable interface
    //@{
    void fromXML(XMLNode* node) override;
    XMLNode* toXML(XMLDocument& doc) const override;
    //@}

    //! \name Inspectors
    //@{
    QuantLib::Size maxIterations() const { return maxIterations_; }
    QuantLib::Real accuracy() const { return accuracy_; }
    QuantLib::Real initialGuess() const { return initialGuess_; }
    QuantLib::Real lowerBound() const { return lowerBound_; }
    QuantLib::Real upperBound() const { return upperBound_; }
    //@}

private:
    QuantLib::Size maxIterations_;
    QuantLib::Real accuracy_;
    QuantLib::Real initialGuess_;
    QuantLib::Real lowerBound_;
    QuantLib::Real upperBound_;

    //! Basic checks, throws InvalidInputError
    void check() const;
};

} // namespace data
} // namespace loanrisk

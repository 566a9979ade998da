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


/*! \file lra/app/parameters.hpp
    \brief LoanRisk setup and analytics choice
    \ingroup app
*/

#pragma once

#include <lrd/utilities/xmlutils.hpp>

#include <map>
#include <string>

namespace loanrisk {
namespace analytics {
using namespace loanrisk::data;
using std::map;
using std::string;

//! Provides the input data and references to input files used in LoanRiskApp
/*! The parameter file has a root node \c LoanRisk with a mandatory \c Setup group, an optional \c Logging group
    and an optional \c Analytics node holding one \c Analytic node per analytic, keyed by its \c type attribute.
    Every group is a list of <tt>\<Parameter name="..."\>value\</Parameter\></tt> entries.
    \ingroup app
 */
class Parameters : public XMLSerializable {
public:
    Parameters() {}

    void clear();
    void fromFile(const string&);
    void fromXML(XMLNode* node) override;
    XMLNode* toXML(XMLDocument& doc) const override;

    bool hasGroup(const string& groupName) const;
    bool has(const string& groupName, const string& paramName) const;
    //! parameter value, throws if \p fail is true and the parameter is missing, returns "" otherwise
    string get(const string& groupName, const string& paramName, bool fail = true) const;
    const map<string, string>& data(const string& groupName) const;

    //! set a parameter, creating the group if necessary
    void set(const string& groupName, const string& paramName, const string& value);

    //! true if the analytic group exists and its \c active parameter is true
    bool isActive(const string& analytic) const;

    void log() const;

private:
    map<string, map<string, string>> data_;
};

} // namespace analytics
} // namespace loanrisk

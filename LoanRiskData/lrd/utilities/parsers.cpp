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

#include <lrd/utilities/errors.hpp>
#include <lrd/utilities/parsers.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <ql/utilities/dataparsers.hpp>
#include <ql/utilities/null.hpp>

#include <algorithm>
#include <cctype>

using namespace QuantLib;
using std::string;
using std::vector;

namespace loanrisk {
namespace data {

namespace {
bool allDigits(const string& s) {
    for (char c : s)
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    return true;
}
} // namespace

Date parseDate(const string& s) {
    string str = boost::algorithm::trim_copy(s);
    LOANRISK_REQUIRE_INPUT(!str.empty(), "Cannot convert empty string to Date");

    try {
        // yyyy-mm-dd
        if (str.size() == 10 && str[4] == '-' && str[7] == '-' && allDigits(str.substr(0, 4)) &&
            allDigits(str.substr(5, 2)) && allDigits(str.substr(8, 2))) {
            return DateParser::parseISO(str);
        }
        // yyyymmdd
        if (str.size() == 8 && allDigits(str)) {
            Year y = boost::lexical_cast<Year>(str.substr(0, 4));
            Month m = static_cast<Month>(boost::lexical_cast<Integer>(str.substr(4, 2)));
            Day d = boost::lexical_cast<Day>(str.substr(6, 2));
            return Date(d, m, y);
        }
    } catch (const std::exception& e) {
        LOANRISK_REQUIRE_INPUT(false, "Cannot convert \"" << str << "\" to Date: " << e.what());
    }
    LOANRISK_REQUIRE_INPUT(false, "Cannot convert \"" << str << "\" to Date, expected yyyy-mm-dd or yyyymmdd");
    return Date();
}

Real parseReal(const string& s) {
    try {
        return std::stod(boost::algorithm::trim_copy(s));
    } catch (const std::exception& e) {
        LOANRISK_REQUIRE_INPUT(false, "Failed to parseReal(\"" << s << "\") " << e.what());
    }
    return Null<Real>();
}

bool tryParseReal(const string& s, Real& result) {
    try {
        string str = boost::algorithm::trim_copy(s);
        std::size_t pos = 0;
        result = std::stod(str, &pos);
        if (pos != str.size()) {
            result = Null<Real>();
            return false;
        }
    } catch (const std::exception&) {
        result = Null<Real>();
        return false;
    }
    return true;
}

Integer parseInteger(const string& s) {
    try {
        return boost::lexical_cast<Integer>(boost::algorithm::trim_copy(s));
    } catch (const std::exception& e) {
        LOANRISK_REQUIRE_INPUT(false, "Failed to parseInteger(\"" << s << "\") " << e.what());
    }
    return Null<Integer>();
}

bool parseBool(const string& s) {
    static const vector<string> trueStrings = {"Y", "YES", "TRUE", "true", "True", "1"};
    static const vector<string> falseStrings = {"N", "NO", "FALSE", "false", "False", "0"};
    string str = boost::algorithm::trim_copy(s);
    if (std::find(trueStrings.begin(), trueStrings.end(), str) != trueStrings.end())
        return true;
    if (std::find(falseStrings.begin(), falseStrings.end(), str) != falseStrings.end())
        return false;
    LOANRISK_REQUIRE_INPUT(false, "Cannot convert \"" << s << "\" to bool");
    return false;
}

vector<string> parseListOfValues(string s) {
    boost::trim(s);
    vector<string> tokens, result;
    if (s.empty())
        return result;
    boost::split(tokens, s, boost::is_any_of(","));
    for (auto& t : tokens) {
        boost::trim(t);
        if (!t.empty())
            result.push_back(t);
    }
    return result;
}

} // namespace data
} // namespace loanrisk

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


/*! \file lrt/fileutilities.hpp
    \brief File utilities for use in unit tests
*/

#pragma once

#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>

#include <fstream>
#include <sstream>
#include <string>

namespace loanrisk {
namespace test {

//! Unique scratch directory below the system temp path, removed on destruction
class TemporaryDirectory {
public:
    TemporaryDirectory()
        : path_(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("loanrisk-%%%%-%%%%-%%%%")) {
        boost::filesystem::create_directories(path_);
    }

    ~TemporaryDirectory() {
        boost::system::error_code ec;
        boost::filesystem::remove_all(path_, ec);
        if (ec)
            BOOST_TEST_MESSAGE("The attempt to remove " << path_ << " failed with error " << ec.message());
    }

    const boost::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    boost::filesystem::path path_;
};

//! Write text to a file, replacing its contents
inline void writeFile(const std::string& fileName, const std::string& contents) {
    std::ofstream out(fileName);
    BOOST_REQUIRE_MESSAGE(out.good(), "could not open " << fileName << " for writing");
    out << contents;
}

//! Read a whole file into a string
inline std::string readFile(const std::string& fileName) {
    std::ifstream in(fileName);
    BOOST_REQUIRE_MESSAGE(in.good(), "could not open " << fileName);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace test
} // namespace loanrisk

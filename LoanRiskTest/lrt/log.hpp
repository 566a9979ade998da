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


/*! \file lrt/log.hpp
    \brief Routing of library log messages into the Boost.Test log
*/

#pragma once

#include <lrd/utilities/log.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>
#include <boost/test/unit_test.hpp>

#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace loanrisk {
namespace test {

//! Logger forwarding every message to BOOST_TEST_MESSAGE
/*! The messages show up when the tests run with --log_level=message or lower.

    The Boost.Test log may only be written from the thread running the test cases. Messages logged on other
    threads, e.g. by the cash flow engine workers, are queued and written on the next message from the test
    thread or on flush().
*/
class BoostTestLogger : public data::Logger {
public:
    inline static const std::string name = "BoostTestLogger";
    BoostTestLogger() : data::Logger(name), testThread_(std::this_thread::get_id()) {}

    void log(unsigned, const std::string& msg) override {
        if (std::this_thread::get_id() != testThread_) {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.push_back(msg);
            return;
        }
        flush();
        BOOST_TEST_MESSAGE(msg);
    }

    //! Write the queued messages, must be called from the test thread
    void flush() {
        std::vector<std::string> msgs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            msgs.swap(pending_);
        }
        for (const auto& m : msgs)
            BOOST_TEST_MESSAGE(m);
    }

    //! Number of queued messages
    std::size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

private:
    std::thread::id testThread_;
    mutable std::mutex mutex_;
    std::vector<std::string> pending_;
};

//! Log mask requested on the command line, none if logging was not requested
/*! \c --loanrisk_log_mask alone requests all levels, \c --loanrisk_log_mask=<mask> a given mask. */
inline boost::optional<unsigned> testLogMask(int argc, char** argv) {
    const std::string flag = "--loanrisk_log_mask";
    boost::optional<unsigned> mask;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == flag)
            mask = 255u;
        else if (boost::starts_with(arg, flag + "="))
            mask = boost::lexical_cast<unsigned>(arg.substr(flag.size() + 1));
    }
    return mask;
}

//! Route the library log into the test log if requested on the command line
inline void setupTestLogging(int argc, char** argv) {
    boost::optional<unsigned> mask = testLogMask(argc, argv);
    if (!mask)
        return;
    data::Log::instance().removeAllLoggers();
    data::Log::instance().registerLogger(QuantLib::ext::make_shared<BoostTestLogger>());
    data::Log::instance().setMask(*mask);
    data::Log::instance().switchOn();
}

} // namespace test
} // namespace loanrisk

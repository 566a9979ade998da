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


/*! \file lrt/toplevelfixture.hpp
    \brief Fixture wrapping every test case
*/

#pragma once

#include <lrt/log.hpp>

#include <boost/test/unit_test.hpp>
#include <ql/settings.hpp>

namespace loanrisk {
namespace test {

//! Top level fixture
/*! Restores the QuantLib settings and the log (switch, mask and the test logger) after each test case, so that a
    test registering or removing loggers does not affect the ones that follow. Messages the test logger queued
    from other threads are written at the end of the test case.
*/
class TopLevelFixture {
public:
    QuantLib::SavedSettings savedSettings;

    TopLevelFixture()
        : logEnabled_(data::Log::instance().enabled()), logMask_(data::Log::instance().mask()),
          testLogger_(data::Log::instance().hasLogger(BoostTestLogger::name)) {}

    virtual ~TopLevelFixture() {
        data::Log& log = data::Log::instance();
        if (log.hasLogger(BoostTestLogger::name)) {
            if (auto l = QuantLib::ext::dynamic_pointer_cast<BoostTestLogger>(log.logger(BoostTestLogger::name)))
                l->flush();
            if (!testLogger_)
                log.removeLogger(BoostTestLogger::name);
        } else if (testLogger_) {
            log.registerLogger(QuantLib::ext::make_shared<BoostTestLogger>());
        }
        log.setMask(logMask_);
        if (logEnabled_)
            log.switchOn();
        else
            log.switchOff();
    }

private:
    bool logEnabled_;
    unsigned logMask_;
    bool testLogger_;
};

} // namespace test
} // namespace loanrisk

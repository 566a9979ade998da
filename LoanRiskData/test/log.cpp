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


#include <boost/test/unit_test.hpp>
#include <lrd/utilities/log.hpp>
#include <lrt/fileutilities.hpp>
#include <lrt/log.hpp>
#include <lrt/toplevelfixture.hpp>

#include <thread>
#include <vector>

using namespace loanrisk::data;
using QuantLib::Size;
using std::string;

namespace {

// Fixture that routes all log output into a buffer logger and removes it afterwards
class LogFixture : public loanrisk::test::TopLevelFixture {
public:
    QuantLib::ext::shared_ptr<BufferLogger> buffer;

    LogFixture() : buffer(QuantLib::ext::make_shared<BufferLogger>()) {
        Log::instance().registerLogger(buffer);
        Log::instance().setMask(255);
        Log::instance().switchOn();
    }

    ~LogFixture() {
        if (Log::instance().hasLogger(BufferLogger::name))
            Log::instance().removeLogger(BufferLogger::name);
    }

    Size drain() {
        Size n = 0;
        while (buffer->hasNext()) {
            buffer->next();
            ++n;
        }
        return n;
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(LoanRiskDataTestSuite, loanrisk::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(LogTests)

BOOST_FIXTURE_TEST_CASE(testLogLevels, LogFixture) {

    BOOST_TEST_MESSAGE("Testing log levels and mask...");

    ALOG("alert");
    WLOG("warning");
    LOG("notice " << 42);
    DLOG("debug");
    TLOG("data");
    BOOST_REQUIRE(buffer->hasNext());
    string first = buffer->next();
    BOOST_CHECK(first.find("ALERT") != string::npos);
    BOOST_CHECK(first.find("alert") != string::npos);
    BOOST_CHECK(first.find("log.cpp") != string::npos);
    BOOST_CHECK(buffer->next().find("WARNING") != string::npos);
    BOOST_CHECK(buffer->next().find("notice 42") != string::npos);
    BOOST_CHECK_EQUAL(drain(), 2);

    // only errors and above
    Log::instance().setMask(LOANRISK_ALERT | LOANRISK_CRITICAL | LOANRISK_ERROR);
    ELOG("error");
    WLOG("warning");
    LOG("notice");
    BOOST_CHECK_EQUAL(drain(), 1);

    // nothing is logged while switched off
    Log::instance().switchOff();
    ALOG("alert");
    BOOST_CHECK_EQUAL(drain(), 0);
}

BOOST_FIXTURE_TEST_CASE(testLoggerRegistry, LogFixture) {

    BOOST_TEST_MESSAGE("Testing logger registration...");

    BOOST_CHECK(Log::instance().hasLogger(BufferLogger::name));
    BOOST_CHECK(Log::instance().logger(BufferLogger::name) == buffer);

    // registering a logger with the same name replaces the existing one
    auto other = QuantLib::ext::make_shared<BufferLogger>();
    Log::instance().registerLogger(other);
    LOG("to the new buffer");
    BOOST_CHECK(!buffer->hasNext());
    BOOST_CHECK(other->hasNext());

    Log::instance().removeLogger(BufferLogger::name);
    BOOST_CHECK(!Log::instance().hasLogger(BufferLogger::name));
    BOOST_CHECK_THROW(Log::instance().removeLogger(BufferLogger::name), QuantLib::Error);
    BOOST_CHECK_THROW(Log::instance().logger(BufferLogger::name), QuantLib::Error);
}

BOOST_FIXTURE_TEST_CASE(testFileLogger, LogFixture) {

    BOOST_TEST_MESSAGE("Testing file logger...");

    loanrisk::test::TemporaryDirectory dir;
    string file = dir.file("test.log");
    Log::instance().registerLogger(QuantLib::ext::make_shared<FileLogger>(file));
    LOG("written to file");
    Log::instance().removeLogger(FileLogger::name);

    BOOST_CHECK(loanrisk::test::readFile(file).find("written to file") != string::npos);
}

BOOST_FIXTURE_TEST_CASE(testStructuredMessage, LogFixture) {

    BOOST_TEST_MESSAGE("Testing structured messages...");

    StructuredMessage msg(StructuredMessage::Category::Error, StructuredMessage::Group::Analytics,
                          "failed \"quoted\"", {{"loanId", "L1"}, {"empty", ""}});
    BOOST_CHECK_EQUAL(msg.json(), "{ \"category\":\"Error\", \"group\":\"Analytics\", "
                                  "\"message\":\"failed \\\"quoted\\\"\", \"loanId\":\"L1\" }");

    msg.log();
    BOOST_REQUIRE(buffer->hasNext());
    string logged = buffer->next();
    BOOST_CHECK(logged.find("ALERT") != string::npos);
    BOOST_CHECK(logged.find("StructuredErrorMessage") != string::npos);

    StructuredMessage(StructuredMessage::Category::Warning, StructuredMessage::Group::Configuration, "check")
        .log();
    BOOST_REQUIRE(buffer->hasNext());
    BOOST_CHECK(buffer->next().find("StructuredWarningMessage") != string::npos);

    BOOST_CHECK_EQUAL(jsonify("a\\b\n"), "a\\\\b\\n");
}

BOOST_AUTO_TEST_CASE(testTestLogMask) {

    BOOST_TEST_MESSAGE("Testing the test log command line flag...");

    char prog[] = "test", other[] = "--log_level=message";
    char flag[] = "--loanrisk_log_mask", masked[] = "--loanrisk_log_mask=31";
    char* none[] = {prog, other};
    char* all[] = {prog, flag};
    char* some[] = {prog, other, masked};

    BOOST_CHECK(!loanrisk::test::testLogMask(2, none));
    BOOST_CHECK_EQUAL(*loanrisk::test::testLogMask(2, all), 255u);
    BOOST_CHECK_EQUAL(*loanrisk::test::testLogMask(3, some), 31u);
}

BOOST_AUTO_TEST_CASE(testTestLoggerQueuesOtherThreads) {

    BOOST_TEST_MESSAGE("Testing that the test logger queues messages from other threads...");

    loanrisk::test::BoostTestLogger logger;
    std::vector<std::thread> threads;
    for (Size i = 0; i < 4; ++i)
        threads.emplace_back([&logger, i]() {
            for (Size j = 0; j < 10; ++j)
                logger.log(LOANRISK_DEBUG, "worker " + std::to_string(i) + " message " + std::to_string(j));
        });
    for (auto& t : threads)
        t.join();
    BOOST_CHECK_EQUAL(logger.pending(), 40u);

    // a message from the test thread writes the queue first
    logger.log(LOANRISK_NOTICE, "test thread message");
    BOOST_CHECK_EQUAL(logger.pending(), 0u);

    std::thread([&logger]() { logger.log(LOANRISK_DEBUG, "late worker message"); }).join();
    BOOST_CHECK_EQUAL(logger.pending(), 1u);
    logger.flush();
    BOOST_CHECK_EQUAL(logger.pending(), 0u);
}

BOOST_AUTO_TEST_CASE(testTestLoggerThroughLog) {

    BOOST_TEST_MESSAGE("Testing the test logger registered with the log...");

    auto logger = QuantLib::ext::make_shared<loanrisk::test::BoostTestLogger>();
    Log::instance().registerLogger(logger);
    Log::instance().setMask(255);
    Log::instance().switchOn();

    std::thread([]() { DLOG("message from a worker thread"); }).join();
    BOOST_CHECK_EQUAL(logger->pending(), 1u);
    LOG("message from the test thread");
    BOOST_CHECK_EQUAL(logger->pending(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

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

#include <lrd/utilities/log.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem/path.hpp>

#include <ql/errors.hpp>

#include <iomanip>
#include <iostream>

using namespace boost::posix_time;
using std::string;

namespace loanrisk {
namespace data {

const string StderrLogger::name = "StderrLogger";
const string FileLogger::name = "FileLogger";
const string BufferLogger::name = "BufferLogger";

void StderrLogger::log(unsigned l, const string& msg) {
    if (!alertOnly_ || l <= LOANRISK_CRITICAL)
        std::cerr << msg << std::endl;
}

FileLogger::FileLogger(const string& filename) : Logger(name), filename_(filename) {
    fout_.open(filename, std::ios_base::out | std::ios_base::app);
    QL_REQUIRE(fout_.is_open(), "Error opening log file " << filename);
}

FileLogger::~FileLogger() {
    if (fout_.is_open())
        fout_.close();
}

void FileLogger::log(unsigned, const string& msg) {
    if (fout_.is_open())
        fout_ << msg << std::endl;
}

void BufferLogger::log(unsigned l, const string& msg) {
    if (l <= minLevel_)
        buffer_.push(msg);
}

bool BufferLogger::hasNext() { return !buffer_.empty(); }

string BufferLogger::next() {
    QL_REQUIRE(!buffer_.empty(), "Log Buffer is empty");
    string msg = buffer_.front();
    buffer_.pop();
    return msg;
}

Log::Log() : loggers_(), enabled_(false), mask_(255), ls_() {
    ls_.setf(std::ios::fixed, std::ios::floatfield);
    ls_.setf(std::ios::showpoint);
}

void Log::registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    loggers_[logger->name()] = logger;
}

bool Log::hasLogger(const string& name) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return loggers_.find(name) != loggers_.end();
}

QuantLib::ext::shared_ptr<Logger> Log::logger(const string& name) {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    auto it = loggers_.find(name);
    QL_REQUIRE(it != loggers_.end(), "No logger found with name " << name);
    return it->second;
}

void Log::removeLogger(const string& name) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    auto it = loggers_.find(name);
    QL_REQUIRE(it != loggers_.end(), "No logger found with name " << name);
    loggers_.erase(it);
}

void Log::removeAllLoggers() {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    loggers_.clear();
}

void Log::header(unsigned m, const char* filename, int lineNo) {
    // 1. Time stamp
    ls_ << to_simple_string(microsec_clock::local_time()) << " ";

    // 2. Level
    switch (m) {
    case LOANRISK_ALERT:
        ls_ << "ALERT    ";
        break;
    case LOANRISK_CRITICAL:
        ls_ << "CRITICAL ";
        break;
    case LOANRISK_ERROR:
        ls_ << "ERROR    ";
        break;
    case LOANRISK_WARNING:
        ls_ << "WARNING  ";
        break;
    case LOANRISK_NOTICE:
        ls_ << "NOTICE   ";
        break;
    case LOANRISK_DEBUG:
        ls_ << "DEBUG    ";
        break;
    case LOANRISK_DATA:
        ls_ << "DATA     ";
        break;
    }

    // 3. source file and line number, strip the path
    ls_ << "[" << boost::filesystem::path(filename).filename().string() << ":" << lineNo << "] : ";
}

void Log::log(unsigned m) {
    string msg = ls_.str();
    for (auto& l : loggers_)
        l.second->log(m, msg);
    ls_.str(string());
    ls_.clear();
}

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Category& category) {
    switch (category) {
    case StructuredMessage::Category::Error:
        return out << "Error";
    case StructuredMessage::Category::Warning:
        return out << "Warning";
    default:
        return out << "UnknownType";
    }
}

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Group& group) {
    switch (group) {
    case StructuredMessage::Group::Analytics:
        return out << "Analytics";
    case StructuredMessage::Group::Configuration:
        return out << "Configuration";
    case StructuredMessage::Group::Portfolio:
        return out << "Portfolio";
    case StructuredMessage::Group::Logging:
        return out << "Logging";
    default:
        return out << "UnknownType";
    }
}

string jsonify(const string& s) {
    string str;
    str.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '\\':
            str += "\\\\";
            break;
        case '"':
            str += "\\\"";
            break;
        case '\n':
            str += "\\n";
            break;
        case '\t':
            str += "\\t";
            break;
        case '\r':
            break;
        default:
            str += c;
        }
    }
    return str;
}

string StructuredMessage::json() const {
    std::ostringstream msg;
    msg << "{ \"category\":\"" << category_ << "\", \"group\":\"" << group_ << "\", \"message\":\""
        << jsonify(message_) << "\"";
    for (const auto& kv : subFields_) {
        if (!kv.second.empty())
            msg << ", \"" << kv.first << "\":\"" << jsonify(kv.second) << "\"";
    }
    msg << " }";
    return msg.str();
}

void StructuredMessage::log() const {
    if (category_ == Category::Error) {
        ALOG("StructuredErrorMessage " << json());
    } else {
        WLOG("StructuredWarningMessage " << json());
    }
}

} // namespace data
} // namespace loanrisk

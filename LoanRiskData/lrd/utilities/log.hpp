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

/*! \file lrd/utilities/log.hpp
    \brief Classes and functions for log message handling.
    \ingroup utilities
*/

#pragma once

// accumulated 'filter' for 'external' DEBUG_MASK
#define LOANRISK_ALERT 1
#define LOANRISK_CRITICAL 2
#define LOANRISK_ERROR 4
#define LOANRISK_WARNING 8
#define LOANRISK_NOTICE 16
#define LOANRISK_DEBUG 32
#define LOANRISK_DATA 64

#include <fstream>
#include <map>
#include <queue>
#include <sstream>
#include <string>

#include <boost/thread/lock_types.hpp>
#include <boost/thread/shared_mutex.hpp>

#include <ql/patterns/singleton.hpp>
#include <ql/shared_ptr.hpp>

namespace loanrisk {
namespace data {

//! The Base Custom Log class
/*!
  This class is the interface all loggers implement. A logger is registered with
  the Log singleton by name and receives every message that passes the log mask.

  \ingroup utilities
  \see Log
 */
class Logger {
public:
    //! Destructor
    virtual ~Logger() {}

    //! The Log call back function
    /*!
      This function will be called every time a log message is produced.
      \param level the log level
      \param log the actual log message
     */
    virtual void log(unsigned level, const std::string& log) = 0;

    //! Returns the Logger name
    const std::string& name() const { return name_; }

protected:
    //! Constructor
    /*!
      Implementations must provide a logger name
      \param name the logger name
     */
    Logger(const std::string& name) : name_(name) {}

private:
    std::string name_;
};

//! Stderr Logger
/*!
  This logger writes each log message out to stderr (std::cerr)
  \ingroup utilities
  \see Log
 */
class StderrLogger : public Logger {
public:
    //! the name "StderrLogger"
    static const std::string name;
    //! Constructor
    /*!
      This logger writes all logs to stderr.
      If alertOnly is set to true, it will only write alerts.
     */
    StderrLogger(bool alertOnly = false) : Logger(name), alertOnly_(alertOnly) {}
    //! The log callback that writes to stderr
    void log(unsigned l, const std::string& s) override;

private:
    bool alertOnly_;
};

//! FileLogger
/*!
  This logger writes each log message out to the given file.
  The file is flushed, but not closed, after each log message.
  \ingroup utilities
  \see Log
 */
class FileLogger : public Logger {
public:
    //! the name "FileLogger"
    static const std::string name;
    //! Constructor
    /*!
      Construct a file logger, the file is opened in append mode.
      \param filename the log filename
     */
    explicit FileLogger(const std::string& filename);
    //! Destructor
    ~FileLogger() override;
    //! The log callback
    void log(unsigned, const std::string&) override;

private:
    std::string filename_;
    std::fstream fout_;
};

//! BufferLogger
/*!
  This logger stores each log message in an internal buffer, it can then be read back
  for log messages at a later point. Log messages are always returned in FIFO order.

  Typical usage to display log messages would be
  <pre>
      while (bLogger.hasNext()) {
          MsgBox("Log Message", bLogger.next());
      }
  </pre>
  \ingroup utilities
  \see Log
 */
class BufferLogger : public Logger {
public:
    //! the name "BufferLogger"
    static const std::string name;
    //! Constructor
    BufferLogger(unsigned minLevel = LOANRISK_DATA) : Logger(name), minLevel_(minLevel) {}
    //! The log callback
    void log(unsigned, const std::string&) override;

    //! Checks if Logger has new messages
    bool hasNext();
    //! Retrieve new messages
    std::string next();

private:
    std::queue<std::string> buffer_;
    unsigned minLevel_;
};

//! Global static Log class
/*!
  The Global Log class gets registered with individual loggers and receives application log messages.
  Once a message is received, it is immediately dispatched to each of the registered loggers, the order in which
  the loggers are called is not guaranteed.

  Logging is done by the calling thread and the LOG call blocks until all the loggers have returned.

  At start up, the Log class has no loggers and so will ignore any LOG() messages until it is configured.

  To configure the Log class to log to a file "/tmp/loanrisk.log":
  <pre>
    Log::instance().registerLogger(QuantLib::ext::make_shared<FileLogger>("/tmp/loanrisk.log"));
    Log::instance().switchOn();
  </pre>

  To change the Log class to only use a BufferLogger:
  <pre>
    Log::instance().removeAllLoggers();
    Log::instance().registerLogger(QuantLib::ext::make_shared<BufferLogger>());
  </pre>

  \ingroup utilities
  \see Logger
 */
class Log : public QuantLib::Singleton<Log, std::integral_constant<bool, true>> {

    friend class QuantLib::Singleton<Log, std::integral_constant<bool, true>>;

public:
    //! Add a new Logger.
    /*! Adding a new logger will replace an existing logger with the same name. */
    void registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger);
    //! Check if logger exists
    bool hasLogger(const std::string& name) const;
    //! Retrieve a Logger.
    QuantLib::ext::shared_ptr<Logger> logger(const std::string& name);
    //! Remove a Logger
    void removeLogger(const std::string& name);
    //! Remove all loggers
    void removeAllLoggers();

    //! macro utility function - do not use directly
    void header(unsigned m, const char* filename, int lineNo);
    //! macro utility function - do not use directly
    std::ostream& logStream() { return ls_; }
    //! macro utility function - do not use directly
    void log(unsigned m);

    //! mutex to serialise the writing of a single log message
    boost::shared_mutex& mutex() { return mutex_; }

    // Avoid a large number of warnings in VS by adding 0 !=
    bool filter(unsigned mask) const { return 0 != (mask & mask_); }
    unsigned mask() const { return mask_; }
    void setMask(unsigned mask) { mask_ = mask; }

    bool enabled() const { return enabled_; }
    void switchOn() { enabled_ = true; }
    void switchOff() { enabled_ = false; }

private:
    Log();

    std::map<std::string, QuantLib::ext::shared_ptr<Logger>> loggers_;
    bool enabled_;
    unsigned mask_;
    std::ostringstream ls_;

    mutable boost::shared_mutex mutex_;
};

/*!
  Main Logging macro, do not use this directly, use on of the below 6 macros instead
 */
#define MLOG(mask, text)                                                                                               \
    {                                                                                                                  \
        if (loanrisk::data::Log::instance().enabled() && loanrisk::data::Log::instance().filter(mask)) {             \
            boost::unique_lock<boost::shared_mutex> lock(loanrisk::data::Log::instance().mutex());                     \
            loanrisk::data::Log::instance().header(mask, __FILE__, __LINE__);                                          \
            loanrisk::data::Log::instance().logStream() << text;                                                       \
            loanrisk::data::Log::instance().log(mask);                                                                 \
        }                                                                                                              \
    }

//! Logging Macro (Level = Alert)
#define ALOG(text) MLOG(LOANRISK_ALERT, text)
//! Logging Macro (Level = Critical)
#define CLOG(text) MLOG(LOANRISK_CRITICAL, text)
//! Logging Macro (Level = Error)
#define ELOG(text) MLOG(LOANRISK_ERROR, text)
//! Logging Macro (Level = Warning)
#define WLOG(text) MLOG(LOANRISK_WARNING, text)
//! Logging Macro (Level = Notice)
#define LOG(text) MLOG(LOANRISK_NOTICE, text)
//! Logging Macro (Level = Debug)
#define DLOG(text) MLOG(LOANRISK_DEBUG, text)
//! Logging Macro (Level = Data)
#define TLOG(text) MLOG(LOANRISK_DATA, text)

//! Base class for structured log messages
/*!
  A structured message carries a category, a group, a free text message and optional sub fields. It is rendered
  as a single JSON-like line so that a hosting application can parse the errors and warnings of a run.
  \ingroup utilities
 */
class StructuredMessage {
public:
    enum class Category { Error, Warning, Unknown };
    enum class Group { Analytics, Configuration, Portfolio, Logging, Unknown };

    StructuredMessage(Category category, Group group, const std::string& message,
                      const std::map<std::string, std::string>& subFields = {})
        : category_(category), group_(group), message_(message), subFields_(subFields) {}
    virtual ~StructuredMessage() {}

    Category category() const { return category_; }
    Group group() const { return group_; }
    const std::string& message() const { return message_; }
    const std::map<std::string, std::string>& subFields() const { return subFields_; }

    //! JSON-like representation of the message
    std::string json() const;

    //! Write the message to the log, errors go to ALOG, warnings to WLOG
    void log() const;

protected:
    Category category_;
    Group group_;
    std::string message_;
    std::map<std::string, std::string> subFields_;
};

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Category& category);
std::ostream& operator<<(std::ostream& out, const StructuredMessage::Group& group);

//! Escape a string for inclusion in a JSON string literal
std::string jsonify(const std::string& s);

} // namespace data
} // namespace loanrisk

/*
 Copyright (C) 2026 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of CRE, a free-software/open-source library
 for multi-curve calibration and market quote risk analysis

 CRE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file cred/utilities/log.hpp
    \brief Classes and functions for log message handling.
    \ingroup utilities
*/

#pragma once

// accumulated 'filter' for 'external' DEBUG_MASK
#define CRE_ALERT 1       // 00000001   1 = 2^1-1
#define CRE_CRITICAL 2    // 00000010   2
#define CRE_ERROR 4       // 00000100   4
#define CRE_WARNING 8     // 00001000   8
#define CRE_NOTICE 16     // 00010000  16
#define CRE_DEBUG 32      // 00100000  32
#define CRE_DATA 64       // 01000000  64
#define CRE_ALWAYS 255    // logged whenever logging is switched on

#include <fstream>
#include <map>
#include <ostream>
#include <queue>
#include <sstream>
#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <boost/thread/lock_types.hpp>

#include <ql/patterns/singleton.hpp>
#include <ql/shared_ptr.hpp>

namespace cre {
namespace data {

//! The Base Custom Log Handler class
/*!
  \ingroup utilities
 */
class Logger {
public:
    //! Destructor
    virtual ~Logger() {}

    //! The Log call back function
    /*!
        This function will be called every time a log message is produced.
        \param level the log level
        \param s the log message
     */
    virtual void log(unsigned level, const std::string& s) = 0;

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
    StderrLogger() : Logger(name) {}
    //! Destructor
    virtual ~StderrLogger() {}
    //! The log callback
    virtual void log(unsigned, const std::string&) override;
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
      Opens the given file.
      \param filename the log filename
     */
    FileLogger(const std::string& filename);
    //! Destructor
    virtual ~FileLogger();
    //! The log callback
    virtual void log(unsigned, const std::string&) override;

private:
    std::string filename_;
    std::fstream fout_;
};

//! BufferLogger
/*!
  This logger stores each log message in an internal buffer, its log messages can then be read at a later point.
  Log messages are always returned in FIFO order.

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
    BufferLogger(unsigned minLevel = CRE_DATA) : Logger(name), minLevel_(minLevel) {}
    //! Destructor
    virtual ~BufferLogger() {}
    //! The log callback
    virtual void log(unsigned, const std::string&) override;

    //! Checks if Logger has new messages
    /*!
      \return True if this Logger has any new log messages
     */
    bool hasNext();
    //! Retrieve new messages
    /*!
      Retrieve the next new message from the buffer, this will throw if the buffer is empty.
      Messages are returned in a FIFO order. Messages are deleted from the buffer once returned.
      \return The next message
     */
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

  To configure the Log class to log to a file "/tmp/cre.log":
  <pre>
      Log::instance().registerLogger(QuantLib::ext::make_shared<FileLogger>("/tmp/cre.log"));
  </pre>

  To change the Log configuration one must first removeLogger() and then registerLogger().

  \ingroup utilities
  \see Logger
 */
class Log : public QuantLib::Singleton<Log, std::integral_constant<bool, true>> {

    friend class QuantLib::Singleton<Log, std::integral_constant<bool, true>>;

public:
    //! Add a new Logger.
    /*! Adding a new logger will replace any existing logger with the same name */
    void registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger);
    //! Check if logger exists
    bool hasLogger(const std::string& name) const;
    //! Retrieve a Logger.
    /*! Retrieve a Logger from the Log, throws if the name is not found */
    QuantLib::ext::shared_ptr<Logger> logger(const std::string& name);
    //! Remove a Logger
    /*! Remove a logger by name, throws if the name is not found */
    void removeLogger(const std::string& name);
    //! Remove all loggers
    void removeAllLoggers();

    //! macro utility function - do not use directly
    void header(unsigned m, const char* filename, int lineNo);
    //! macro utility function - do not use directly
    std::ostream& logStream() { return ls_; }
    //! macro utility function - do not use directly
    void log(unsigned m);

    //! mutex to acquire locks
    boost::shared_mutex& mutex() { return mutex_; }

    // Avoid a large number of warnings in VS by adding 0 !=
    bool filter(unsigned mask) {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return enabled_ && ((0 != (mask & mask_)) || mask == CRE_ALWAYS);
    }
    unsigned mask() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return mask_;
    }
    void setMask(unsigned mask) {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        mask_ = mask;
    }

    const boost::filesystem::path& rootPath() { return rootPath_; }
    void setRootPath(const std::string& pathString) {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        rootPath_ = boost::filesystem::path(pathString);
    }
    int maxLen() { return maxLen_; }
    void setMaxLen(const int n) {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        maxLen_ = n;
    }

    bool enabled() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return enabled_;
    }
    void switchOn() {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        enabled_ = true;
    }
    void switchOff() {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        enabled_ = false;
    }

private:
    Log();

    std::map<std::string, QuantLib::ext::shared_ptr<Logger>> loggers_;
    bool enabled_;
    unsigned mask_;
    boost::filesystem::path rootPath_;
    std::ostringstream ls_;

    int maxLen_ = 45;

    mutable boost::shared_mutex mutex_;
};

/*!
  Main Logging macro, do not use this directly, use one of the below 7 macros instead
 */
#define MLOG(mask, text)                                                                                               \
    {                                                                                                                  \
        if (cre::data::Log::instance().filter(mask)) {                                                                 \
            std::ostringstream __cre_mlog_tmp_stringstream;                                                            \
            __cre_mlog_tmp_stringstream << text;                                                                       \
            boost::unique_lock<boost::shared_mutex> lock(cre::data::Log::instance().mutex());                          \
            cre::data::Log::instance().header(mask, __FILE__, __LINE__);                                               \
            cre::data::Log::instance().logStream() << __cre_mlog_tmp_stringstream.str();                               \
            cre::data::Log::instance().log(mask);                                                                      \
        }                                                                                                              \
    }

//! Logging Macro (Level = Alert)
#define ALOG(text) MLOG(CRE_ALERT, text);
//! Logging Macro (Level = Critical)
#define CLOG(text) MLOG(CRE_CRITICAL, text);
//! Logging Macro (Level = Error)
#define ELOG(text) MLOG(CRE_ERROR, text);
//! Logging Macro (Level = Warning)
#define WLOG(text) MLOG(CRE_WARNING, text);
//! Logging Macro (Level = Notice)
#define LOG(text) MLOG(CRE_NOTICE, text);
//! Logging Macro (Level = Debug)
#define DLOG(text) MLOG(CRE_DEBUG, text);
//! Logging Macro (Level = Data)
#define TLOG(text) MLOG(CRE_DATA, text);

//! Base class for structured log messages
/*! A structured message carries a category, a group, a free text message and a set of
    named fields. It is written as a single line in JSON format, so that the messages can be
    picked up from a log file by downstream tools.

    \ingroup utilities
 */
class StructuredMessage {
public:
    enum class Category { Error, Warning, Unknown };
    enum class Group { Calibration, Configuration, Curve, MarketData, Scenario, Trade, Logging, Unknown };

    StructuredMessage(const Category& category, const Group& group, const std::string& message,
                      const std::map<std::string, std::string>& subFields = std::map<std::string, std::string>())
        : category_(category), group_(group), message_(message), subFields_(subFields) {}
    virtual ~StructuredMessage() {}

    static constexpr const char* name = "StructuredMessage";

    //! \name Inspectors
    //@{
    Category category() const { return category_; }
    Group group() const { return group_; }
    const std::string& message() const { return message_; }
    const std::map<std::string, std::string>& subFields() const { return subFields_; }
    //@}

    //! the message in JSON format
    std::string json() const;

    //! writes the message to the Log, errors with level CRE_ALERT, warnings with level CRE_WARNING
    void log() const;

private:
    Category category_;
    Group group_;
    std::string message_;
    std::map<std::string, std::string> subFields_;
};

std::ostream& operator<<(std::ostream& out, const StructuredMessage& message);
std::ostream& operator<<(std::ostream& out, const StructuredMessage::Category& category);
std::ostream& operator<<(std::ostream& out, const StructuredMessage::Group& group);

} // namespace data
} // namespace cre

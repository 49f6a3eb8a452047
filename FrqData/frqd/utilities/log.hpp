/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of ORE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 ORE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file frqd/utilities/log.hpp
    \brief Classes and functions for log message handling.
    \ingroup utilities
*/

#pragma once

// accumulated 'filter' for 'external' DEBUG_MASK
#define FRQ_ALERT 1    // 00000001   1 = 2^1-1
#define FRQ_CRITICAL 2 // 00000010   2 = 2^2-2
#define FRQ_ERROR 4    // 00000100   4 = 2^3-4
#define FRQ_WARNING 8  // 00001000   8 = 2^4-8
#define FRQ_NOTICE 16  // 00010000  16 = 2^5-16
#define FRQ_DEBUG 32   // 00100000  32 = 2^6-32
#define FRQ_DATA 64    // 01000000  64 = 2^7-64

#include <fstream>
#include <map>
#include <queue>
#include <sstream>
#include <string>
#include <type_traits>

#include <ql/patterns/singleton.hpp>
#include <ql/shared_ptr.hpp>

#include <boost/thread/lock_types.hpp>
#include <boost/thread/shared_mutex.hpp>

namespace frq {
namespace data {

//! The Base Custom Log Handler class
/*!
  This base log handler class can be used to define your own custom handler and then registered with the Log class.
  Once registered it will receive all log messages as soon as they occur via it's log() method
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
  This logger writes each log message out to stderr
  \ingroup utilities
  \see Log
 */
class StderrLogger : public Logger {
public:
    //! the name "StderrLogger"
    static const std::string name;
    //! Constructor, by default only ALERT and CRITICAL messages are echoed
    StderrLogger(unsigned mask = FRQ_ALERT | FRQ_CRITICAL) : Logger(name), mask_(mask) {}
    //! The log callback that writes to stderr
    void log(unsigned level, const std::string& msg) override;

private:
    unsigned mask_;
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
      Construct a file logger using the given filename, this filename is passed to std::fostream::open()
      and this constructor will throw an exception if the file is not opened (e.g. if the filename is invalid)
      \param filename the log filename
     */
    FileLogger(const std::string& filename);
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
  This logger stores each log message in an internal buffer, it can then be probed for log messages at a later point.
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
    BufferLogger(unsigned minLevel = FRQ_DATA) : Logger(name), minLevel_(minLevel) {}
    //! The log callback
    void log(unsigned level, const std::string& s) override;

    //! Checks if Logger has new messages
    /*!
      \return True if this BufferLogger has any new log messages
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

  To configure the Log class to log to a file "/tmp/frq.log":
  <pre>
      Log::instance().registerLogger(QuantLib::ext::make_shared<FileLogger>("/tmp/frq.log"));
  </pre>

  To change the Log class to only use a BufferLogger:
  <pre>
      Log::instance().removeAllLoggers();
      Log::instance().registerLogger(QuantLib::ext::make_shared<BufferLogger>());
      ...
      // Then later, to retrieve the log messages
      QuantLib::ext::shared_ptr<BufferLogger> bl =
          QuantLib::ext::dynamic_pointer_cast<BufferLogger>(Log::instance().logger(BufferLogger::name));
      while (bl->hasNext()) {
          std::string msg = bl->next();
          ...
      }
  </pre>

  To use the Log class in code:
  <pre>
      WLOG("Unknown frequency alias " << alias << ", falling back to period parser");
  </pre>
  \ingroup utilities
 */
class Log : public QuantLib::Singleton<Log, std::integral_constant<bool, true>> {

    friend class QuantLib::Singleton<Log, std::integral_constant<bool, true>>;

public:
    //! Add a new Logger.
    /*! Adding a new logger will replace a previously registered logger of the same name
     */
    void registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger);
    //! Check if logger exists
    bool hasLogger(const std::string& name) const;
    //! Retrieve a Logger.
    QuantLib::ext::shared_ptr<Logger>& logger(const std::string& name);
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

    //! mutex to acquire locks
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
  Main Logging macro, do not use this directly, use on of the below 7 macros instead
 */
#define MLOG(mask, text)                                                                                               \
    {                                                                                                                  \
        if (frq::data::Log::instance().enabled() && frq::data::Log::instance().filter(mask)) {                         \
            boost::unique_lock<boost::shared_mutex> lock(frq::data::Log::instance().mutex());                          \
            frq::data::Log::instance().header(mask, __FILE__, __LINE__);                                               \
            frq::data::Log::instance().logStream() << text;                                                            \
            frq::data::Log::instance().log(mask);                                                                      \
        }                                                                                                              \
    }

//! Logging Macro (Level = Alert)
#define ALOG(text) MLOG(FRQ_ALERT, text)
//! Logging Macro (Level = Critical)
#define CLOG(text) MLOG(FRQ_CRITICAL, text)
//! Logging Macro (Level = Error)
#define ELOG(text) MLOG(FRQ_ERROR, text)
//! Logging Macro (Level = Warning)
#define WLOG(text) MLOG(FRQ_WARNING, text)
//! Logging Macro (Level = Notice)
#define LOG(text) MLOG(FRQ_NOTICE, text)
//! Logging Macro (Level = Debug)
#define DLOG(text) MLOG(FRQ_DEBUG, text)
//! Logging Macro (Level = Data)
#define TLOG(text) MLOG(FRQ_DATA, text)

} // namespace data
} // namespace frq

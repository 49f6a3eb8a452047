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

/*! \file frqd/utilities/log.cpp
    \brief Classes and functions for log message handling.
    \ingroup utilities
*/

#include <frqd/utilities/log.hpp>

#include <ql/errors.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <cstring>
#include <iostream>

using namespace std;
using namespace boost::posix_time;

namespace frq {
namespace data {

const string StderrLogger::name = "StderrLogger";
const string FileLogger::name = "FileLogger";
const string BufferLogger::name = "BufferLogger";

void StderrLogger::log(unsigned level, const string& msg) {
    if ((level & mask_) != 0)
        std::cerr << msg << std::endl;
}

FileLogger::FileLogger(const string& filename) : Logger(name), filename_(filename) {
    fout_.open(filename.c_str(), ios_base::out);
    QL_REQUIRE(fout_.is_open(), "Error opening file " << filename);
    fout_.setf(ios::fixed, ios::floatfield);
    fout_.setf(ios::showpoint);
}

FileLogger::~FileLogger() {
    if (fout_.is_open())
        fout_.close();
}

void FileLogger::log(unsigned, const string& msg) {
    if (fout_.is_open())
        fout_ << msg << endl;
}

void BufferLogger::log(unsigned level, const string& msg) {
    if (level <= minLevel_)
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
    ls_.setf(ios::fixed, ios::floatfield);
    ls_.setf(ios::showpoint);
}

void Log::registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    loggers_[logger->name()] = logger;
}

bool Log::hasLogger(const string& name) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return loggers_.find(name) != loggers_.end();
}

QuantLib::ext::shared_ptr<Logger>& Log::logger(const string& name) {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    auto it = loggers_.find(name);
    QL_REQUIRE(it != loggers_.end(), "No logger found with name " << name);
    return it->second;
}

void Log::removeLogger(const string& name) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    auto it = loggers_.find(name);
    if (it != loggers_.end()) {
        loggers_.erase(it);
    } else {
        QL_FAIL("No logger found with name " << name);
    }
}

void Log::removeAllLoggers() {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    loggers_.clear();
}

void Log::header(unsigned m, const char* filename, int lineNo) {
    // 1. Time stamp
    // Use boost::posix_time microsecond clock to get better precision (when available).
    // format is "2014-Apr-04 11:10:24.705000"
    ls_ << to_simple_string(microsec_clock::local_time()) << " ";

    // 2. Log level
    switch (m) {
    case FRQ_ALERT:
        ls_ << "ALERT    ";
        break;
    case FRQ_CRITICAL:
        ls_ << "CRITICAL ";
        break;
    case FRQ_ERROR:
        ls_ << "ERROR    ";
        break;
    case FRQ_WARNING:
        ls_ << "WARNING  ";
        break;
    case FRQ_NOTICE:
        ls_ << "NOTICE   ";
        break;
    case FRQ_DEBUG:
        ls_ << "DEBUG    ";
        break;
    case FRQ_DATA:
        ls_ << "DATA     ";
        break;
    }

    // 3. source file and line number
    // strip the path from the file name
    const char* p = std::strrchr(filename, '/');
    p = p ? p + 1 : filename;
    ls_ << "(" << p << ":" << lineNo << ") : ";
}

void Log::log(unsigned m) {
    string msg = ls_.str();
    for (auto& l : loggers_)
        l.second->log(m, msg);
    // clear stream
    ls_.str(string());
    ls_.clear();
}

} // namespace data
} // namespace frq

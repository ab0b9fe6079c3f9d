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

/*! \file cred/utilities/log.cpp
    \brief Classes and functions for log message handling.
    \ingroup utilities
*/

#include <cred/utilities/log.hpp>

#include <ql/errors.hpp>

#include <boost/algorithm/string/replace.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem/operations.hpp>

#include <iomanip>
#include <iostream>

using namespace boost::filesystem;
using std::string;

namespace cre {
namespace data {

// Log
const string StderrLogger::name = "StderrLogger";
const string FileLogger::name = "FileLogger";
const string BufferLogger::name = "BufferLogger";

// -- Stderr Logger

void StderrLogger::log(unsigned, const string& msg) { std::cerr << msg << std::endl; }

// -- File Logger

FileLogger::FileLogger(const string& filename) : Logger(name), filename_(filename) {
    fout_.open(filename.c_str(), std::ios_base::out);
    QL_REQUIRE(fout_.is_open(), "Error opening file " << filename);
    fout_.setf(std::ios::fixed, std::ios::floatfield);
    fout_.setf(std::ios::showpoint);
}

FileLogger::~FileLogger() {
    if (fout_.is_open())
        fout_.close();
}

void FileLogger::log(unsigned, const string& msg) {
    if (fout_.is_open())
        fout_ << msg << std::endl;
}

// -- Buffer Logger

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

// The Log itself
Log::Log() : loggers_(), enabled_(false), mask_(255), ls_() {
    ls_.setf(std::ios::fixed, std::ios::floatfield);
    ls_.setf(std::ios::showpoint);
}

void Log::registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    QL_REQUIRE(loggers_.find(logger->name()) == loggers_.end(),
               "Logger with name " << logger->name() << " already registered");
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
    // 1. Reset stringstream
    ls_.str(string());
    ls_.clear();

    // Write the header to the stream
    // TYPE [Time stamp] (file:line)
    switch (m) {
    case CRE_ALERT:
        ls_ << "ALERT    ";
        break;
    case CRE_CRITICAL:
        ls_ << "CRITICAL ";
        break;
    case CRE_ERROR:
        ls_ << "ERROR    ";
        break;
    case CRE_WARNING:
        ls_ << "WARNING  ";
        break;
    case CRE_NOTICE:
        ls_ << "NOTICE   ";
        break;
    case CRE_DEBUG:
        ls_ << "DEBUG    ";
        break;
    case CRE_DATA:
        ls_ << "DATA     ";
        break;
    case CRE_ALWAYS:
        ls_ << "ALWAYS   ";
        break;
    }

    ls_ << '[' << boost::posix_time::to_simple_string(boost::posix_time::microsec_clock::local_time()) << ']';

    // Filename relative to the root path, shortened to maxLen_
    string filepath;
    if (rootPath_.empty()) {
        filepath = filename;
    } else {
        filepath = relative(path(filename), rootPath_).string();
    }
    int lineNoLen = (int)std::to_string(lineNo).length();
    int len = 2 + (int)filepath.length() + 1 + lineNoLen + 1; // " (" + filepath + ':' + lineNo + ')'
    if (len > maxLen_)
        filepath = "..." + filepath.substr(len - maxLen_ + 3);

    ls_ << " (" << filepath << ':' << lineNo << ") : ";
}

void Log::log(unsigned m) {
    string msg = ls_.str();
    for (auto& l : loggers_)
        l.second->log(m, msg);
}

// -- Structured messages

namespace {
string jsonEscape(const string& s) {
    string r = s;
    boost::replace_all(r, "\\", "\\\\");
    boost::replace_all(r, "\"", "\\\"");
    boost::replace_all(r, "\n", "\\n");
    boost::replace_all(r, "\r", "\\r");
    boost::replace_all(r, "\t", "\\t");
    return r;
}
} // namespace

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Category& category) {
    switch (category) {
    case StructuredMessage::Category::Error:
        return out << "Error";
    case StructuredMessage::Category::Warning:
        return out << "Warning";
    case StructuredMessage::Category::Unknown:
        return out << "UnknownType";
    }
    QL_FAIL("unknown structured message category");
}

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Group& group) {
    switch (group) {
    case StructuredMessage::Group::Calibration:
        return out << "Calibration";
    case StructuredMessage::Group::Configuration:
        return out << "Configuration";
    case StructuredMessage::Group::Curve:
        return out << "Curve";
    case StructuredMessage::Group::MarketData:
        return out << "Market Data";
    case StructuredMessage::Group::Scenario:
        return out << "Scenario";
    case StructuredMessage::Group::Trade:
        return out << "Trade";
    case StructuredMessage::Group::Logging:
        return out << "Logging";
    case StructuredMessage::Group::Unknown:
        return out << "UnknownType";
    }
    QL_FAIL("unknown structured message group");
}

string StructuredMessage::json() const {
    std::ostringstream out;
    out << "{ \"category\":\"" << category_ << "\", \"group\":\"" << group_ << "\", \"message\":\""
        << jsonEscape(message_) << "\"";
    if (!subFields_.empty()) {
        out << ", \"sub_fields\": [ ";
        bool first = true;
        for (auto const& f : subFields_) {
            if (!first)
                out << ", ";
            out << "{ \"name\": \"" << jsonEscape(f.first) << "\", \"value\": \"" << jsonEscape(f.second) << "\" }";
            first = false;
        }
        out << " ]";
    }
    out << " }";
    return out.str();
}

void StructuredMessage::log() const {
    switch (category_) {
    case Category::Error:
        ALOG(*this);
        break;
    case Category::Warning:
        WLOG(*this);
        break;
    case Category::Unknown:
        LOG(*this);
        break;
    }
}

std::ostream& operator<<(std::ostream& out, const StructuredMessage& message) {
    return out << StructuredMessage::name << message.json();
}

} // namespace data
} // namespace cre

// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef logging_hpp
#define logging_hpp

#define BOOST_LOG_DYN_LINK 1

#include <cstddef>
#include <functional>
#include <sstream>
#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/global_logger_storage.hpp>

namespace polyscan { namespace logging {

enum class severity_level { trace, debug, info, warning, error, fatal };

std::ostream& operator<<(std::ostream& os, severity_level level);

BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(logger, boost::log::sources::severity_logger<severity_level>)
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

/*
    Info and above go to std::clog. A debug log file receives everything except trace records,
    a trace log file receives everything.
*/
void init(boost::optional<boost::filesystem::path> debug_log = boost::none,
          boost::optional<boost::filesystem::path> trace_log = boost::none);

// Each write is one log record
template <severity_level Level>
class Logger
{
public:
    Logger() : lg_ {logger::get()} {}
    
    template <typename T>
    void write(const T& msg) { BOOST_LOG_SEV(lg_, Level) << msg; }
    
private:
    boost::log::sources::severity_logger<severity_level> lg_;
};

template <severity_level Level, typename T>
Logger<Level>& operator<<(Logger<Level>& log, const T& msg)
{
    log.write(msg);
    return log;
}

using TraceLogger   = Logger<severity_level::trace>;
using DebugLogger   = Logger<severity_level::debug>;
using InfoLogger    = Logger<severity_level::info>;
using WarningLogger = Logger<severity_level::warning>;
using ErrorLogger   = Logger<severity_level::error>;
using FatalLogger   = Logger<severity_level::fatal>;

/*
    Collects a message from several << calls and writes it to the underlying log as one record when
    destroyed. Continuation lines of a multi-line message are indented.
*/
template <typename Log>
class LogStream
{
public:
    LogStream() = delete;
    
    LogStream(Log& log, const unsigned indent) : log_ {log}, buffer_ {}, indent_ {}
    {
        if (indent > 0) indent_.assign(indent, ' ');
    }
    
    LogStream(const LogStream&)            = delete;
    LogStream& operator=(const LogStream&) = delete;
    LogStream(LogStream&&)                 = default;
    LogStream& operator=(LogStream&&)      = default;
    
    ~LogStream()
    {
        const auto message = buffer_.str();
        std::string record {};
        record.reserve(message.size());
        for (std::size_t i {0}; i < message.size(); ++i) {
            record += message[i];
            if (message[i] == '\n' && i + 1 < message.size()) record += indent_;
        }
        if (!record.empty() && record.back() == '\n') record.pop_back();
        log_.get() << record;
    }
    
    template <typename T>
    void write(const T& msg) { buffer_ << msg; }
    
private:
    std::reference_wrapper<Log> log_;
    std::ostringstream buffer_;
    std::string indent_;
};

template <typename Log, typename T>
LogStream<Log>& operator<<(LogStream<Log>& ls, const T& msg)
{
    ls.write(msg);
    return ls;
}

template <typename Log, typename T>
LogStream<Log>& operator<<(LogStream<Log>&& ls, const T& msg)
{
    ls.write(msg);
    return ls;
}

template <typename Log>
auto stream(Log& log, const unsigned indent = 4)
{
    return LogStream<Log> {log, indent};
}

} // namespace logging
} // namespace polyscan

#endif

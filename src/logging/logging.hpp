// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef logging_hpp
#define logging_hpp

#define BOOST_LOG_DYN_LINK 1

#include <ostream>
#include <sstream>
#include <string>
#include <functional>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/global_logger_storage.hpp>

namespace varcanon { namespace logging {

enum class severity_level { trace, debug, info, warning, error, fatal };

std::ostream& operator<<(std::ostream& os, severity_level level);

using SeverityLogger = boost::log::sources::severity_logger_mt<severity_level>;

BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(global_logger, SeverityLogger)
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

/*
 Console output shows info and above. The optional debug file additionally
 receives debug records and the optional trace file receives everything but
 debug records.
 */
void init(boost::optional<boost::filesystem::path> debug_file = boost::none,
          boost::optional<boost::filesystem::path> trace_file = boost::none);

template <severity_level Level>
class Logger
{
public:
    Logger() : logger_ {global_logger::get()} {}
    
    void write(const std::string& message) { BOOST_LOG_SEV(logger_.get(), Level) << message; }
    
private:
    std::reference_wrapper<SeverityLogger> logger_;
};

template <severity_level Level, typename T>
Logger<Level>& operator<<(Logger<Level>& log, const T& message)
{
    std::ostringstream ss {};
    ss << message;
    log.write(ss.str());
    return log;
}

using TraceLogger   = Logger<severity_level::trace>;
using DebugLogger   = Logger<severity_level::debug>;
using InfoLogger    = Logger<severity_level::info>;
using WarningLogger = Logger<severity_level::warning>;
using ErrorLogger   = Logger<severity_level::error>;
using FatalLogger   = Logger<severity_level::fatal>;

// Buffers everything streamed into it and emits a single record on destruction.
// Continuation lines are indented.
template <typename Log>
class LogStream
{
public:
    LogStream() = delete;
    
    LogStream(Log& log, unsigned indent) : log_ {log}, buffer_ {}, indent_ {indent} {}
    
    LogStream(const LogStream&)            = delete;
    LogStream& operator=(const LogStream&) = delete;
    LogStream(LogStream&&)                 = default;
    LogStream& operator=(LogStream&&)      = default;
    
    ~LogStream() { log_.get() << indented(buffer_.str()); }
    
    std::ostringstream& buffer() noexcept { return buffer_; }
    
private:
    std::reference_wrapper<Log> log_;
    std::ostringstream buffer_;
    unsigned indent_;
    
    std::string indented(std::string message) const
    {
        if (!message.empty() && message.back() == '\n') message.pop_back();
        if (indent_ == 0) return message;
        std::string result {};
        result.reserve(message.size());
        for (const char c : message) {
            result += c;
            if (c == '\n') result.append(indent_, ' ');
        }
        return result;
    }
};

template <typename Log>
LogStream<Log> stream(Log& log, const unsigned indent = 4)
{
    return LogStream<Log> {log, indent};
}

template <typename Log, typename T>
LogStream<Log>& operator<<(LogStream<Log>& ls, const T& message)
{
    ls.buffer() << message;
    return ls;
}

template <typename Log, typename T>
LogStream<Log>& operator<<(LogStream<Log>&& ls, const T& message)
{
    ls.buffer() << message;
    return ls;
}

template <typename Log>
void log_empty_line(Log& log)
{
    log << "";
}

} // namespace logging
} // namespace varcanon

#endif

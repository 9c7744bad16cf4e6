// Copyright (C) 2016 iNuron NV
//
// This file is part of Open vStorage Open Source Edition (OSE),
// as available from
//
//      http://www.openvstorage.org and
//      http://www.openvstorage.com.
//
// This file is free software; you can redistribute it and/or modify it
// under the terms of the GNU Affero General Public License v3 (GNU AGPLv3)
// as published by the Free Software Foundation, in version 3 as it comes in
// the LICENSE.txt file of the Open vStorage OSE distribution.
// Open vStorage is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY of any kind.

#include "Assert.h"
#include "Logger.h"

#include <unistd.h>

#include <atomic>
#include <iomanip>
#include <sstream>
#include <unordered_map>

#include <boost/asio/ip/host_name.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/exception_handler.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/lock_guard.hpp>
#include <boost/thread/mutex.hpp>

namespace youtils
{

namespace bl = boost::log;

namespace
{

const std::string logger_id_key("ID");
const std::string severity_key("Severity");
const std::string thread_id_key("ThreadID");
const std::string timestamp_key("TimeStamp");

// Filters are a debugging aid, so the common case is an empty table which
// is represented by a nullptr to keep Logger::filter cheap.
using FilterTable = std::unordered_map<std::string, Severity>;
using FilterTablePtr = boost::shared_ptr<FilterTable>;

// LOCKING:
// * Logger::filter reads the table and the global severity lock free
// * update_lock serializes table updates and logging setup / teardown
FilterTablePtr filter_table;
std::atomic<Severity> global_severity(Severity::info);
boost::mutex update_lock;

std::string program_name;

using LogSinkPtr = boost::shared_ptr<bl::sinks::sink>;
std::unordered_map<std::string, LogSinkPtr> log_sinks;

template<typename F>
void
update_filter_table(F&& fun)
{
    boost::lock_guard<decltype(update_lock)> g(update_lock);

    FilterTablePtr old(boost::atomic_load(&filter_table));
    FilterTablePtr table(old ?
                         boost::make_shared<FilterTable>(*old) :
                         boost::make_shared<FilterTable>());
    fun(*table);

    if (table->empty())
    {
        table = nullptr;
    }

    boost::atomic_store(&filter_table,
                        table);
}

void
log_formatter(const bl::record_view& rec,
              bl::formatting_ostream& os)
{
    static const char* sep = " - ";
    static const pid_t pid(::getpid());
    static const std::string hostname(boost::asio::ip::host_name());
    static std::atomic<uint64_t> seqnum(0);

    const auto ts(bl::extract<boost::posix_time::ptime>(timestamp_key,
                                                        rec));
    if (ts)
    {
        os << boost::posix_time::to_iso_extended_string(*ts);
    }

    std::stringstream sseq;
    sseq << std::hex << std::setw(16) << std::setfill('0') << seqnum++;

    os << sep <<
        hostname << sep <<
        pid << "/" <<
        bl::extract_or_default<bl::attributes::current_thread_id::value_type>(thread_id_key,
                                                                              rec,
                                                                              bl::attributes::current_thread_id::value_type()) << sep <<
        program_name << "/" <<
        bl::extract_or_default<std::string>(logger_id_key,
                                            rec,
                                            std::string("(UnspecifiedComponent)")) << sep <<
        sseq.str() << sep;

    const auto sev(bl::extract<Severity>(severity_key,
                                         rec));
    if (sev)
    {
        os << *sev;
    }

    os << sep << rec[bl::expressions::smessage];
}

LogSinkPtr
make_console_sink()
{
    using ConsoleSink = bl::sinks::synchronous_sink<bl::sinks::text_ostream_backend>;

    auto sink(boost::make_shared<ConsoleSink>());
    boost::shared_ptr<std::ostream> stream(&std::clog,
                                           boost::null_deleter());
    sink->locked_backend()->add_stream(stream);
    sink->locked_backend()->auto_flush(true);
    sink->set_formatter(&log_formatter);

    return sink;
}

LogSinkPtr
make_file_sink(const std::string& path,
               const LogRotation log_rotation)
{
    using FileBackend = bl::sinks::text_file_backend;
    using FileSink = bl::sinks::synchronous_sink<FileBackend>;

    auto backend(boost::make_shared<FileBackend>(bl::keywords::file_name = path,
                                                 bl::keywords::open_mode = std::ios::out bitor std::ios::app,
                                                 bl::keywords::auto_flush = true));

    if (T(log_rotation))
    {
        // rotate at midnight
        backend->set_time_based_rotation(bl::sinks::file::rotation_at_time_point(0,
                                                                                 0,
                                                                                 0));
    }

    auto sink(boost::make_shared<FileSink>(backend));
    sink->set_formatter(&log_formatter);

    return sink;
}

void
throw_unless_enabled()
{
    if (not Logger::loggingEnabled())
    {
        throw LoggerNotConfiguredException("Logging is disabled");
    }
}

}

SeverityLoggerWithName::SeverityLoggerWithName(const std::string& n)
    : name(n)
{
    logger_.add_attribute(logger_id_key,
                          bl::attributes::constant<std::string>(name));
}

void
Logger::setupLogging(const std::string& progname,
                     const std::vector<std::string>& sinks,
                     const Severity severity,
                     const LogRotation log_rotation)
{
    boost::lock_guard<decltype(update_lock)> g(update_lock);

    global_severity = severity;

    if (log_sinks.empty())
    {
        program_name = progname;

        bl::core::get()->add_global_attribute(thread_id_key,
                                              bl::attributes::current_thread_id());
        bl::core::get()->add_global_attribute(timestamp_key,
                                              bl::attributes::local_clock());

        for (const auto& s : sinks)
        {
            if (s == console_sink_name())
            {
                log_sinks.emplace(s,
                                  make_console_sink());
            }
            else
            {
                log_sinks.emplace(s,
                                  make_file_sink(s,
                                                 log_rotation));
            }
        }

        for (const auto& p : log_sinks)
        {
            bl::core::get()->add_sink(p.second);
        }
    }

    bl::core::get()->set_exception_handler(bl::make_exception_suppressor());
    bl::core::get()->set_logging_enabled(true);
}

void
Logger::teardownLogging()
{
    update_filter_table([&](FilterTable& table)
                        {
                            for (const auto& p : log_sinks)
                            {
                                p.second->flush();
                            }

                            bl::core::get()->remove_all_sinks();
                            bl::core::get()->set_logging_enabled(false);
                            table.clear();
                            log_sinks.clear();
                        });
}

void
Logger::disableLogging()
{
    bl::core::get()->set_logging_enabled(false);
}

void
Logger::enableLogging()
{
    if (log_sinks.empty())
    {
        throw LoggerNotConfiguredException("Logging is not configured");
    }

    bl::core::get()->set_logging_enabled(true);
}

bool
Logger::loggingEnabled()
{
    return bl::core::get()->get_logging_enabled();
}

void
Logger::generalLogging(Severity severity)
{
    throw_unless_enabled();
    global_severity = severity;
}

Severity
Logger::generalLogging()
{
    throw_unless_enabled();
    return global_severity;
}

void
Logger::add_filter(const std::string& logger_name,
                   const Severity severity)
{
    throw_unless_enabled();
    update_filter_table([&](FilterTable& table)
                        {
                            table[logger_name] = severity;
                        });
}

void
Logger::remove_filter(const std::string& logger_name)
{
    throw_unless_enabled();
    update_filter_table([&](FilterTable& table)
                        {
                            table.erase(logger_name);
                        });
}

void
Logger::remove_all_filters()
{
    throw_unless_enabled();
    update_filter_table([&](FilterTable& table)
                        {
                            table.clear();
                        });
}

std::vector<Logger::filter_t>
Logger::all_filters()
{
    throw_unless_enabled();

    std::vector<filter_t> res;
    FilterTablePtr table(boost::atomic_load(&filter_table));
    if (table != nullptr)
    {
        res.assign(table->begin(),
                   table->end());
    }

    return res;
}

bool
Logger::filter(const std::string& logger_name,
               const Severity sev)
{
    if (not loggingEnabled())
    {
        return false;
    }

    FilterTablePtr table(boost::atomic_load(&filter_table));
    if (table != nullptr)
    {
        const auto it = table->find(logger_name);
        if (it != table->end())
        {
            return sev >= it->second;
        }
    }

    return sev >= global_severity;
}

namespace
{

const char*
severity_to_string(const Severity severity)
{
    switch (severity)
    {
    case Severity::trace:
        return "trace";
    case Severity::debug:
        return "debug";
    case Severity::periodic:
        return "periodic";
    case Severity::info:
        return "info";
    case Severity::warning:
        return "warning";
    case Severity::error:
        return "error";
    case Severity::fatal:
        return "fatal";
    case Severity::notification:
        return "notice";
    }
    UNREACHABLE;
}

}

std::ostream&
operator<<(std::ostream& os,
           Severity severity)
{
    return os << severity_to_string(severity);
}

std::istream&
operator>>(std::istream& is,
           Severity& severity)
{
    static const std::vector<Severity> all{ Severity::trace,
                                            Severity::debug,
                                            Severity::periodic,
                                            Severity::info,
                                            Severity::warning,
                                            Severity::error,
                                            Severity::fatal,
                                            Severity::notification };
    std::string str;
    is >> str;

    for (const auto s : all)
    {
        if (str == severity_to_string(s))
        {
            severity = s;
            return is;
        }
    }

    is.setstate(std::ios_base::failbit);
    return is;
}

}

// Local Variables: **
// mode: c++ **
// End: **

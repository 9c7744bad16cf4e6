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

#ifndef YT_LOGGER_H_
#define YT_LOGGER_H_

#include "BooleanEnum.h"
#include "IOException.h"

#include <string>
#include <utility>
#include <vector>

#include <boost/log/sources/severity_logger.hpp>

namespace youtils
{

BOOLEAN_ENUM(LogRotation);

enum class Severity
{
    trace,
    debug,
    periodic,
    info,
    warning,
    error,
    fatal,
    notification
};

std::ostream&
operator<<(std::ostream& os,
           Severity severity);

std::istream&
operator>>(std::istream& is,
           Severity& severity);

MAKE_EXCEPTION(LoggerException, fungi::IOException);
MAKE_EXCEPTION(LoggerNotConfiguredException, LoggerException);

class SeverityLoggerWithName
{
public:
    using logger_type = boost::log::sources::severity_logger_mt<Severity>;

    explicit SeverityLoggerWithName(const std::string& n);

    SeverityLoggerWithName(const SeverityLoggerWithName&) = delete;

    SeverityLoggerWithName&
    operator=(const SeverityLoggerWithName&) = delete;

    logger_type&
    get()
    {
        return logger_;
    }

    // kept here as extracting it from logger_ is expensive
    const std::string name;

private:
    logger_type logger_;
};

class Logger
{
public:
    using filter_t = std::pair<std::string, Severity>;
    using logger_type = SeverityLoggerWithName;

    Logger() = delete;

    static const std::string&
    console_sink_name()
    {
        static const std::string n("console:");
        return n;
    }

    // sinks: console_sink_name() or paths to log files
    static void
    setupLogging(const std::string& progname,
                 const std::vector<std::string>& sinks,
                 Severity severity,
                 const LogRotation);

    static void
    teardownLogging();

    static void
    disableLogging();

    static void
    enableLogging();

    static bool
    loggingEnabled();

    static void
    generalLogging(Severity severity);

    static Severity
    generalLogging();

    static void
    add_filter(const std::string& logger_name,
               const Severity severity);

    static void
    remove_filter(const std::string& logger_name);

    static void
    remove_all_filters();

    static std::vector<filter_t>
    all_filters();

    // Called by the LOG_* macros before a record is formatted.
    static bool
    filter(const std::string& logger_name,
           const Severity sev);
};

}

#endif // !YT_LOGGER_H_

// Local Variables: **
// mode: c++ **
// End: **

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

#ifndef YT_MAIN_HELPER_H_
#define YT_MAIN_HELPER_H_

#include "Assert.h"
#include "BooleanEnum.h"
#include "IOException.h"
#include "Logger.h"
#include "Logging.h"

#include <cstring>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/program_options.hpp>

namespace youtils
{

BOOLEAN_ENUM(ExcludeExecutableName);
BOOLEAN_ENUM(AllowUnregisteredOptions);

class MainHelper
{
protected:
    using constructor_type = std::pair<std::string, std::vector<std::string>>;

    static constructor_type
    fromArgcArgv(int argc,
                 char** argv);

    explicit MainHelper(const constructor_type&);

    MainHelper(int argc,
               char** argv);

    virtual ~MainHelper() = default;

public:
    int
    operator()();

protected:
    virtual void
    parse_command_line_arguments() = 0;

    virtual void
    log_extra_help(std::ostream& strm) = 0;

    virtual int
    run() = 0;

    virtual void
    setup_logging() = 0;

    virtual void
    at_exit();

    virtual void
    check_no_unrecognized();

    void
    print_version_data();

    void
    parse_standard_options();

    void
    setup_logging(const std::string& progname);

    SeverityLoggerWithName&
    getLogger__()
    {
        return main_logger_;
    }

    void
    unparsed_options(const boost::program_options::parsed_options& parsed_options,
                     ExcludeExecutableName = ExcludeExecutableName::F);

    void
    unparsed_options(int argc,
                     char** argv);

    const std::vector<std::string>&
    unparsed_options() const;

    boost::program_options::parsed_options
    parse_unparsed_options(const boost::program_options::options_description& opts,
                           AllowUnregisteredOptions allow_unregistered,
                           boost::program_options::variables_map& vm);

    // Owns a C style copy of an argument vector, for libraries that want
    // to consume (and rearrange) argc / argv.
    struct ArgcArgv
    {
        ArgcArgv(const std::string& executable_name,
                 const std::vector<std::string>& args)
            : argc_(args.size() + 1)
        {
            copy_(executable_name);
            for (const auto& a : args)
            {
                copy_(a);
            }

            argv_.reserve(strings_.size() + 1);
            for (const auto& s : strings_)
            {
                argv_.push_back(s.get());
            }
            argv_.push_back(nullptr);

            VERIFY(argv_.size() == static_cast<size_t>(argc_) + 1);
        }

        DECLARE_LOGGER("ArgcArgv");

        ~ArgcArgv() = default;

        ArgcArgv(const ArgcArgv&) = delete;

        ArgcArgv&
        operator=(const ArgcArgv&) = delete;

        int*
        argc()
        {
            return &argc_;
        }

        char**
        argv()
        {
            return argv_.data();
        }

    private:
        void
        copy_(const std::string& str)
        {
            std::unique_ptr<char[]> c(new char[str.size() + 1]);
            strncpy(c.get(), str.c_str(), str.size() + 1);
            strings_.emplace_back(std::move(c));
        }

        int argc_;
        std::vector<std::unique_ptr<char[]>> strings_;
        std::vector<char*> argv_;
    };

    boost::program_options::variables_map vm_;
    std::vector<std::string> unparsed_options_;
    const std::string executable_name_;

private:
    boost::program_options::options_description logging_options_;
    boost::program_options::options_description general_options_;
    boost::program_options::options_description standard_options_;

    SeverityLoggerWithName main_logger_;

    std::vector<std::string> logsinks_;
    Severity loglevel_;
    std::vector<std::string> filters_;
};

}

// Defines main() for a MainHelper derived class T constructible from
// (argc, argv).
#define MAIN(T)                                                         \
    int main(int argc, char** argv)                                     \
    {                                                                   \
        static_assert(std::is_base_of<youtils::MainHelper, T>::value,   \
                      #T " does not derive from MainHelper");           \
        return T(argc, argv)();                                         \
    }

#endif // !YT_MAIN_HELPER_H_

// Local Variables: **
// mode: c++ **
// End: **

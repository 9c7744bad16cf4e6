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

#ifndef YT_IOEXCEPTION_H_
#define YT_IOEXCEPTION_H_

#include <exception>
#include <string>

namespace fungi
{

// Root of all exceptions thrown by youtils and lvmcoord.
class IOException
    : public std::exception
{
public:
    // name and error_code (an errno value) are appended to msg if given
    IOException(const char* msg,
                const char* name = nullptr,
                int error_code = 0);

    explicit IOException(std::string&& str);

    explicit IOException(const std::string& str);

    virtual ~IOException() noexcept = default;

    virtual const char*
    what() const noexcept override;

    int
    getErrorCode() const
    {
        return error_code_;
    }

private:
    int error_code_;
    std::string msg_;
};

}

#define MAKE_EXCEPTION(myex, parentex)                                  \
    class myex                                                          \
        : public parentex                                               \
    {                                                                   \
    public:                                                             \
        myex(const char* msg,                                           \
             const char* name = nullptr,                                \
             int error_code = 0)                                        \
            : parentex(msg, name, error_code)                           \
        {}                                                              \
                                                                        \
        explicit myex(std::string&& str)                                \
            : parentex(std::move(str))                                  \
        {}                                                              \
                                                                        \
        explicit myex(const std::string& str)                           \
            : parentex(str)                                             \
        {}                                                              \
    };

#endif // !YT_IOEXCEPTION_H_

// Local Variables: **
// mode: c++ **
// End: **

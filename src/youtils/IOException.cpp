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

#include "IOException.h"

#include <cstring>
#include <sstream>

namespace fungi
{

IOException::IOException(const char* msg,
                         const char* name,
                         int error_code)
    : error_code_(error_code)
    , msg_(msg ? msg : "")
{
    std::stringstream ss;

    if (name != nullptr)
    {
        ss << " " << name;
    }

    if (error_code != 0)
    {
        char buf[256];
        // GNU strerror_r may or may not use buf
        const char* res = ::strerror_r(error_code,
                                       buf,
                                       sizeof(buf));
        ss << ": " << (res ? res : "unknown error") << " (" << error_code << ")";
    }

    msg_ += ss.str();
}

IOException::IOException(std::string&& str)
    : error_code_(0)
    , msg_(std::move(str))
{}

IOException::IOException(const std::string& str)
    : error_code_(0)
    , msg_(str)
{}

const char*
IOException::what() const noexcept
{
    return msg_.c_str();
}

}

// Local Variables: **
// mode: c++ **
// End: **

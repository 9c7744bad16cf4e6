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

#include "FilterBuilder.h"

#include <cstring>
#include <sstream>

#include <boost/algorithm/string/trim.hpp>

namespace lvmcoord
{

namespace ba = boost::algorithm;

namespace
{

const char regex_metachars[] = ".[](){}*+?^$|";

void
add_(DeviceSnapshot& snap,
     const DeviceList& devices)
{
    for (const auto& d : devices)
    {
        std::string s(ba::trim_copy(d));
        if (not s.empty())
        {
            snap.emplace(std::move(s));
        }
    }
}

}

DeviceSnapshot
FilterBuilder::normalize(const DeviceList& devices,
                         const DeviceList& extra_devices)
{
    DeviceSnapshot snap;

    add_(snap,
         devices);
    add_(snap,
         extra_devices);

    return snap;
}

std::string
FilterBuilder::escape(const std::string& device)
{
    std::string res;
    res.reserve(device.size() * 2);

    for (const char c : device)
    {
        if (c == '\\')
        {
            res += "\\\\";
        }
        else if (c != '\0' and strchr(regex_metachars, c) != nullptr)
        {
            res += "\\\\";
            res += c;
        }
        else
        {
            res += c;
        }
    }

    return res;
}

std::string
FilterBuilder::build(const DeviceSnapshot& snapshot)
{
    std::stringstream ss;

    ss << "[";

    if (not snapshot.empty())
    {
        ss << "\"a|";
        for (const auto& d : snapshot)
        {
            ss << "^" << escape(d) << "$|";
        }
        ss << "\", ";
    }

    ss << "\"r|.*|\"]";

    return ss.str();
}

std::string
FilterBuilder::build(const DeviceList& devices,
                     const DeviceList& extra_devices)
{
    return build(normalize(devices,
                           extra_devices));
}

}

// Local Variables: **
// mode: c++ **
// End: **

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

#include "DirectoryDeviceView.h"

namespace lvmcoord
{

namespace fs = boost::filesystem;

namespace
{

// device-mapper's control node lives in /dev/mapper as well
const std::string control_node("control");

}

DirectoryDeviceView::DirectoryDeviceView(const fs::path& dir)
    : dir_(dir)
{}

DeviceList
DirectoryDeviceView::devices()
{
    DeviceList devs;
    boost::system::error_code ec;

    fs::directory_iterator it(dir_, ec);
    if (ec)
    {
        LOG_ERROR("Failed to list " << dir_ << ": " << ec.message());
        throw DeviceViewException("Failed to list device directory",
                                  dir_.string().c_str(),
                                  ec.value());
    }

    const fs::directory_iterator end;
    while (it != end)
    {
        const fs::path& p = it->path();
        if (p.filename() != control_node)
        {
            devs.emplace_back(p.string());
        }

        it.increment(ec);
        if (ec)
        {
            LOG_ERROR("Failed to list " << dir_ << ": " << ec.message());
            throw DeviceViewException("Failed to list device directory",
                                      dir_.string().c_str(),
                                      ec.value());
        }
    }

    return devs;
}

}

// Local Variables: **
// mode: c++ **
// End: **

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

#ifndef LVMCOORD_DIRECTORY_DEVICE_VIEW_H_
#define LVMCOORD_DIRECTORY_DEVICE_VIEW_H_

#include "DeviceView.h"

#include <boost/filesystem.hpp>

#include <youtils/Logging.h>

namespace lvmcoord
{

// Lists the entries of a directory (typically /dev/mapper) as devices.
class DirectoryDeviceView
    : public DeviceView
{
public:
    explicit DirectoryDeviceView(const boost::filesystem::path& dir);

    ~DirectoryDeviceView() = default;

    DirectoryDeviceView(const DirectoryDeviceView&) = delete;

    DirectoryDeviceView&
    operator=(const DirectoryDeviceView&) = delete;

    DeviceList
    devices() override final;

    const boost::filesystem::path&
    directory() const
    {
        return dir_;
    }

private:
    DECLARE_LOGGER("DirectoryDeviceView");

    const boost::filesystem::path dir_;
};

}

#endif // !LVMCOORD_DIRECTORY_DEVICE_VIEW_H_

// Local Variables: **
// mode: c++ **
// End: **

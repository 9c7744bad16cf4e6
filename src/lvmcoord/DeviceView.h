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

#ifndef LVMCOORD_DEVICE_VIEW_H_
#define LVMCOORD_DEVICE_VIEW_H_

#include "Types.h"

#include <youtils/IOException.h>

namespace lvmcoord
{

MAKE_EXCEPTION(DeviceViewException, fungi::IOException);

// The block devices (multipath maps) currently visible to this host.
// Implementations throw if the set cannot be determined; an empty result
// means there really are no devices.
class DeviceView
{
public:
    virtual ~DeviceView() = default;

    virtual DeviceList
    devices() = 0;
};

}

#endif // !LVMCOORD_DEVICE_VIEW_H_

// Local Variables: **
// mode: c++ **
// End: **

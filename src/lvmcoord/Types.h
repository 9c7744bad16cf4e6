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

#ifndef LVMCOORD_TYPES_H_
#define LVMCOORD_TYPES_H_

#include <set>
#include <string>
#include <vector>

namespace lvmcoord
{

// Device identifiers (e.g. /dev/mapper/<wwid>) as reported by a DeviceView
// or passed in by callers, in no particular order and possibly with
// duplicates.
using DeviceList = std::vector<std::string>;

// The normalized set of devices a filter was built from.
using DeviceSnapshot = std::set<std::string>;

// An lvm command line without the lvm binary, e.g. { "vgs", "-o", "+tags" }.
using LvmCommand = std::vector<std::string>;

}

#endif // !LVMCOORD_TYPES_H_

// Local Variables: **
// mode: c++ **
// End: **

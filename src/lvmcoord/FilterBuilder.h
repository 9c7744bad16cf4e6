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

#ifndef LVMCOORD_FILTER_BUILDER_H_
#define LVMCOORD_FILTER_BUILDER_H_

#include "Types.h"

#include <string>

namespace lvmcoord
{

// Builds lvm's devices/filter setting that accepts exactly a given set of
// devices and rejects everything else:
//
//   ["a|^/dev/mapper/a$|^/dev/mapper/b$|", "r|.*|"]
//
// or, for an empty set, just ["r|.*|"].
struct FilterBuilder
{
    // Merges both lists, strips surrounding whitespace and drops empty
    // identifiers. The result is sorted and free of duplicates.
    static DeviceSnapshot
    normalize(const DeviceList& devices,
              const DeviceList& extra_devices = DeviceList());

    // Backslashes are doubled, other regex metacharacters are prefixed
    // with an (escaped) backslash so they match literally.
    static std::string
    escape(const std::string& device);

    static std::string
    build(const DeviceSnapshot& snapshot);

    static std::string
    build(const DeviceList& devices,
          const DeviceList& extra_devices = DeviceList());
};

}

#endif // !LVMCOORD_FILTER_BUILDER_H_

// Local Variables: **
// mode: c++ **
// End: **

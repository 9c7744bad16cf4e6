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

#ifndef LVMCOORD_CONFIG_BUILDER_H_
#define LVMCOORD_CONFIG_BUILDER_H_

#include "LockingMode.h"

#include <string>

namespace lvmcoord
{

// The argument to lvm's --config option. Only the filter and the locking
// type vary, everything else is fixed.
struct ConfigBuilder
{
    static std::string
    build(const std::string& filter,
          const LockingMode mode);
};

}

#endif // !LVMCOORD_CONFIG_BUILDER_H_

// Local Variables: **
// mode: c++ **
// End: **

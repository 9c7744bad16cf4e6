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

#include "ConfigBuilder.h"

#include <sstream>

namespace lvmcoord
{

// lvm parses this, so the layout (down to the whitespace) must not change.
std::string
ConfigBuilder::build(const std::string& filter,
                     const LockingMode mode)
{
    std::stringstream ss;

    ss << "devices { "
       << " preferred_names=[\"^/dev/mapper/\"] "
       << " ignore_suspended_devices=1 "
       << " write_cache_state=0 "
       << " disable_after_error_count=3 "
       << " filter=" << filter << " "
       << "} "
       << "global { "
       << " locking_type=" << lock_type(mode) << " "
       << " prioritise_write_locks=1 "
       << " wait_for_locks=1 "
       << " use_lvmetad=0 "
       << "} "
       << "backup { "
       << " retain_min=50 "
       << " retain_days=0 "
       << "}";

    return ss.str();
}

}

// Local Variables: **
// mode: c++ **
// End: **

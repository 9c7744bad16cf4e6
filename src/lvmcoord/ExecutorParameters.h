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

#ifndef LVMCOORD_EXECUTOR_PARAMETERS_H_
#define LVMCOORD_EXECUTOR_PARAMETERS_H_

#include "LockingMode.h"

#include <string>
#include <vector>

#include <youtils/InitializedParam.h>

namespace initialized_params
{

extern const char lvm_command_executor_component_name[];

DECLARE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_max_commands, uint32_t);
DECLARE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_read_only_retries, uint32_t);
DECLARE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_retry_delay_ms, uint64_t);
DECLARE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_binary, std::string);
DECLARE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_extra_devices, std::vector<std::string>);
DECLARE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_initial_locking_mode, lvmcoord::LockingMode);
DECLARE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_use_sudo, bool);
DECLARE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_sudo_binary, std::string);
DECLARE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_device_directory, std::string);

}

#endif // !LVMCOORD_EXECUTOR_PARAMETERS_H_

// Local Variables: **
// mode: c++ **
// End: **

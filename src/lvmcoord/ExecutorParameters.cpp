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

#include "ExecutorParameters.h"

namespace initialized_params
{

namespace lc = lvmcoord;

extern const char lvm_command_executor_component_name[] = "lvm_command_executor";

DEFINE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_max_commands,
                                      lvm_command_executor_component_name,
                                      "lvm_max_commands",
                                      "Maximum number of lvm processes running concurrently",
                                      ShowDocumentation::T,
                                      10U);

DEFINE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_read_only_retries,
                                      lvm_command_executor_component_name,
                                      "lvm_read_only_retries",
                                      "Number of times a failed command is retried in shared (read-only) mode",
                                      ShowDocumentation::T,
                                      4U);

DEFINE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_retry_delay_ms,
                                      lvm_command_executor_component_name,
                                      "lvm_retry_delay_ms",
                                      "Delay between retries in shared mode, in milliseconds",
                                      ShowDocumentation::T,
                                      1000ULL);

DEFINE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_binary,
                                      lvm_command_executor_component_name,
                                      "lvm_binary",
                                      "Path to the lvm binary",
                                      ShowDocumentation::T,
                                      std::string("/sbin/lvm"));

DEFINE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_extra_devices,
                                      lvm_command_executor_component_name,
                                      "lvm_extra_devices",
                                      "Devices that are always accepted by the lvm filter, e.g. local disks holding a volume group",
                                      ShowDocumentation::T,
                                      std::vector<std::string>());

DEFINE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_initial_locking_mode,
                                      lvm_command_executor_component_name,
                                      "lvm_initial_locking_mode",
                                      "Locking mode at startup: exclusive (pool master) or shared",
                                      ShowDocumentation::T,
                                      lc::LockingMode::Exclusive);

DEFINE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_use_sudo,
                                      lvm_command_executor_component_name,
                                      "lvm_use_sudo",
                                      "Whether to run lvm through sudo",
                                      ShowDocumentation::T,
                                      true);

DEFINE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_sudo_binary,
                                      lvm_command_executor_component_name,
                                      "lvm_sudo_binary",
                                      "Path to the sudo binary",
                                      ShowDocumentation::T,
                                      std::string("/usr/bin/sudo"));

DEFINE_INITIALIZED_PARAM_WITH_DEFAULT(lvm_device_directory,
                                      lvm_command_executor_component_name,
                                      "lvm_device_directory",
                                      "Directory whose entries are the devices lvm may see",
                                      ShowDocumentation::T,
                                      std::string("/dev/mapper"));

}

// Local Variables: **
// mode: c++ **
// End: **

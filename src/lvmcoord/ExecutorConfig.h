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

#ifndef LVMCOORD_EXECUTOR_CONFIG_H_
#define LVMCOORD_EXECUTOR_CONFIG_H_

#include "ExecutorParameters.h"
#include "Types.h"

#include <boost/chrono.hpp>
#include <boost/property_tree/ptree_fwd.hpp>

#include <youtils/ConfigComponent.h>
#include <youtils/ConfigurationReport.h>

namespace lvmcoord
{

// The "lvm_command_executor" section of the configuration.
class ExecutorConfig
    : public youtils::ConfigComponent
{
public:
    explicit ExecutorConfig(const boost::property_tree::ptree&);

    ~ExecutorConfig() = default;

    ExecutorConfig(const ExecutorConfig&) = default;

    ExecutorConfig&
    operator=(const ExecutorConfig&) = delete;

    static const char*
    name()
    {
        return initialized_params::lvm_command_executor_component_name;
    }

    // ConfigComponent Interface
    const char*
    componentName() const override final
    {
        return name();
    }

    void
    persist(boost::property_tree::ptree&,
            const ReportDefault = ReportDefault::F) const override final;

    bool
    checkConfig(const boost::property_tree::ptree&,
                youtils::ConfigurationReport&) const override final;

    uint32_t
    max_commands() const
    {
        return lvm_max_commands.value();
    }

    uint32_t
    read_only_retries() const
    {
        return lvm_read_only_retries.value();
    }

    boost::chrono::milliseconds
    retry_delay() const
    {
        return boost::chrono::milliseconds(lvm_retry_delay_ms.value());
    }

    const std::string&
    binary() const
    {
        return lvm_binary.value();
    }

    const DeviceList&
    extra_devices() const
    {
        return lvm_extra_devices.value();
    }

    LockingMode
    initial_locking_mode() const
    {
        return lvm_initial_locking_mode.value();
    }

    bool
    use_sudo() const
    {
        return lvm_use_sudo.value();
    }

    const std::string&
    sudo_binary() const
    {
        return lvm_sudo_binary.value();
    }

    const std::string&
    device_directory() const
    {
        return lvm_device_directory.value();
    }

private:
    DECLARE_LOGGER("ExecutorConfig");

    DECLARE_PARAMETER(lvm_max_commands);
    DECLARE_PARAMETER(lvm_read_only_retries);
    DECLARE_PARAMETER(lvm_retry_delay_ms);
    DECLARE_PARAMETER(lvm_binary);
    DECLARE_PARAMETER(lvm_extra_devices);
    DECLARE_PARAMETER(lvm_initial_locking_mode);
    DECLARE_PARAMETER(lvm_use_sudo);
    DECLARE_PARAMETER(lvm_sudo_binary);
    DECLARE_PARAMETER(lvm_device_directory);
};

}

#endif // !LVMCOORD_EXECUTOR_CONFIG_H_

// Local Variables: **
// mode: c++ **
// End: **

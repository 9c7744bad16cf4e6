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

#include "ExecutorConfig.h"

#include <boost/property_tree/ptree.hpp>

namespace lvmcoord
{

namespace bpt = boost::property_tree;
namespace ip = initialized_params;
namespace yt = youtils;

ExecutorConfig::ExecutorConfig(const bpt::ptree& pt)
    : yt::ConfigComponent(pt)
    , lvm_max_commands(pt)
    , lvm_read_only_retries(pt)
    , lvm_retry_delay_ms(pt)
    , lvm_binary(pt)
    , lvm_extra_devices(pt)
    , lvm_initial_locking_mode(pt)
    , lvm_use_sudo(pt)
    , lvm_sudo_binary(pt)
    , lvm_device_directory(pt)
{}

void
ExecutorConfig::persist(bpt::ptree& pt,
                        const ReportDefault report_default) const
{
#define P(x)                                    \
    x.persist(pt,                               \
              report_default)

    P(lvm_max_commands);
    P(lvm_read_only_retries);
    P(lvm_retry_delay_ms);
    P(lvm_binary);
    P(lvm_extra_devices);
    P(lvm_initial_locking_mode);
    P(lvm_use_sudo);
    P(lvm_sudo_binary);
    P(lvm_device_directory);

#undef P
}

bool
ExecutorConfig::checkConfig(const bpt::ptree& pt,
                            yt::ConfigurationReport& report) const
{
    const ip::PARAMETER_TYPE(lvm_max_commands) max_commands(pt);
    const ip::PARAMETER_TYPE(lvm_binary) binary(pt);
    const ip::PARAMETER_TYPE(lvm_use_sudo) use_sudo(pt);
    const ip::PARAMETER_TYPE(lvm_sudo_binary) sudo_binary(pt);

    bool res = true;

    if (max_commands.value() == 0)
    {
        report.emplace_back(max_commands,
                            "at least one concurrent command is required");
        res = false;
    }

    if (binary.value().empty())
    {
        report.emplace_back(binary,
                            "no lvm binary configured");
        res = false;
    }

    if (use_sudo.value() and sudo_binary.value().empty())
    {
        report.emplace_back(sudo_binary,
                            "sudo is enabled but no sudo binary is configured");
        res = false;
    }

    return res;
}

}

// Local Variables: **
// mode: c++ **
// End: **

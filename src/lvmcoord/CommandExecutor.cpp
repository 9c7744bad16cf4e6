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

#include "CommandExecutor.h"
#include "DeviceView.h"
#include "ExecutorConfig.h"

#include <sstream>

#include <boost/algorithm/string/join.hpp>
#include <boost/thread/thread.hpp>

#include <youtils/Assert.h>

namespace lvmcoord
{

namespace ba = boost::algorithm;

namespace
{

std::string
failure_message(const LvmCommand& cmd,
                const CommandResult& res)
{
    std::stringstream ss;
    ss << "lvm " << ba::join(cmd, " ") << " failed with status " <<
        res.status << ": " << res.err;
    return ss.str();
}

}

CommandFailedException::CommandFailedException(const LvmCommand& cmd,
                                               const CommandResult& res)
    : fungi::IOException(failure_message(cmd,
                                         res))
    , result_(res)
{}

CommandExecutor::CommandExecutor(const ExecutorConfig& cfg,
                                 DeviceView& view,
                                 ProcessRunner& runner)
    : view_(view)
    , runner_(runner)
    , binary_(cfg.binary())
    , read_only_retries_(cfg.read_only_retries())
    , retry_delay_(cfg.retry_delay())
    , cache_(cfg.extra_devices())
    , coordinator_(cfg.initial_locking_mode(),
                   cache_)
    , gate_(cfg.max_commands())
{
    LOG_INFO("lvm: " << binary_ <<
             ", mode: " << coordinator_.mode() <<
             ", max commands: " << gate_.capacity() <<
             ", read only retries: " << read_only_retries_ <<
             ", retry delay: " << retry_delay_.count() << "ms");
}

std::vector<std::string>
CommandExecutor::command_line(const LvmCommand& cmd,
                              const std::string& config) const
{
    VERIFY(not cmd.empty());

    std::vector<std::string> args;
    args.reserve(cmd.size() + 3);

    args.push_back(binary_);
    args.push_back(cmd.front());
    args.push_back("--config");
    args.push_back(config);
    args.insert(args.end(),
                cmd.begin() + 1,
                cmd.end());

    return args;
}

CommandResult
CommandExecutor::run_once_(const LvmCommand& cmd,
                           const CommandCache::Entry& entry)
{
    const std::vector<std::string> args(command_line(cmd,
                                                     entry.config));

    ConcurrencyGate::Slot slot(gate_);
    return runner_.run(args,
                       Privileged::T);
}

CommandResult
CommandExecutor::run(const LvmCommand& cmd,
                     const DeviceList& devices)
{
    VERIFY(not cmd.empty());

    ModeCoordinator::Guard guard(coordinator_);
    const LockingMode mode = guard.mode();

    CommandCache::EntryPtr entry(devices.empty() ?
                                 cache_.get_or_build(view_,
                                                     mode) :
                                 cache_.build_entry(devices,
                                                    mode));

    CommandResult res(run_once_(cmd,
                                *entry));
    if (res.status == 0)
    {
        return res;
    }

    LOG_WARN(failure_message(cmd,
                             res));

    if (not devices.empty())
    {
        // the explicitly given devices might not suffice, e.g. for a VG
        // spanning more devices: try again with everything we see
        CommandCache::EntryPtr wide(cache_.get_or_build(view_,
                                                        mode));
        if (cache_.is_stale(*wide,
                            view_))
        {
            wide = cache_.refresh(view_,
                                  mode);
        }

        // nothing to gain from running the identical command again
        if (wide->config != entry->config)
        {
            entry = wide;
            LOG_INFO(cmd.front() << ": retrying with filter " << entry->filter);
            res = run_once_(cmd,
                            *entry);
        }
    }
    else if (cache_.is_stale(*entry,
                             view_))
    {
        LOG_WARN(cmd.front() << ": filter " << entry->filter <<
                 " is stale, retrying with the current devices");
        entry = cache_.refresh(view_,
                               mode);
        res = run_once_(cmd,
                        *entry);
    }

    if (res.status == 0 or mode == LockingMode::Exclusive)
    {
        return res;
    }

    for (uint32_t i = 0; i < read_only_retries_; ++i)
    {
        boost::this_thread::sleep_for(retry_delay_);

        LOG_INFO(cmd.front() << ": retry " << (i + 1) << " of " <<
                 read_only_retries_ << " in " << mode << " mode");

        res = run_once_(cmd,
                        *entry);
        if (res.status == 0)
        {
            return res;
        }
    }

    LOG_ERROR(cmd.front() << ": giving up after " << read_only_retries_ <<
              " retries: " << res.err);

    return res;
}

CommandResult
CommandExecutor::run_checked(const LvmCommand& cmd,
                             const DeviceList& devices)
{
    CommandResult res(run(cmd,
                          devices));
    if (res.status != 0)
    {
        LOG_ERROR(failure_message(cmd,
                                  res));
        throw CommandFailedException(cmd,
                                     res);
    }

    return res;
}

void
CommandExecutor::set_mode(const LockingMode mode)
{
    coordinator_.set_mode(mode);
}

LockingMode
CommandExecutor::mode() const
{
    return coordinator_.mode();
}

void
CommandExecutor::invalidate_filter()
{
    LOG_INFO("invalidating filter");
    cache_.invalidate();
}

std::string
CommandExecutor::config()
{
    ModeCoordinator::Guard guard(coordinator_);
    return cache_.get_or_build(view_,
                               guard.mode())->config;
}

}

// Local Variables: **
// mode: c++ **
// End: **

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

#ifndef LVMCOORD_COMMAND_EXECUTOR_H_
#define LVMCOORD_COMMAND_EXECUTOR_H_

#include "CommandCache.h"
#include "ConcurrencyGate.h"
#include "LockingMode.h"
#include "ModeCoordinator.h"
#include "ProcessRunner.h"
#include "Types.h"

#include <cstdint>

#include <boost/chrono.hpp>

#include <youtils/IOException.h>
#include <youtils/Logging.h>

namespace lvmcoord
{

class DeviceView;
class ExecutorConfig;

// Thrown by CommandExecutor::run_checked if a command still fails after
// all retries.
class CommandFailedException
    : public fungi::IOException
{
public:
    CommandFailedException(const LvmCommand& cmd,
                           const CommandResult& res);

    ~CommandFailedException() noexcept = default;

    const CommandResult&
    result() const
    {
        return result_;
    }

    int
    status() const
    {
        return result_.status;
    }

private:
    CommandResult result_;
};

// Runs lvm commands with a --config that restricts lvm to the devices
// visible on this host and with the locking type of the current mode.
//
// A failed command is run once more with a rebuilt filter if the visible
// devices changed since the filter was built. In shared mode failures are
// expected (the pool master may be changing metadata underneath) and the
// command is retried up to lvm_read_only_retries times.
//
// Thread safe; the number of concurrently running lvm processes is bounded
// by lvm_max_commands.
class CommandExecutor
{
public:
    CommandExecutor(const ExecutorConfig& cfg,
                    DeviceView& view,
                    ProcessRunner& runner);

    ~CommandExecutor() = default;

    CommandExecutor(const CommandExecutor&) = delete;

    CommandExecutor&
    operator=(const CommandExecutor&) = delete;

    // A nonzero status of the final attempt is returned, not thrown.
    // If devices are given, the first attempt only lets lvm see those (and
    // the configured extra devices); retries use the full device set.
    CommandResult
    run(const LvmCommand& cmd,
        const DeviceList& devices = DeviceList());

    CommandResult
    run_checked(const LvmCommand& cmd,
                const DeviceList& devices = DeviceList());

    // Blocks until the commands in flight are done.
    void
    set_mode(const LockingMode mode);

    LockingMode
    mode() const;

    void
    invalidate_filter();

    // The --config text the next command without explicit devices would
    // be run with.
    std::string
    config();

    std::vector<std::string>
    command_line(const LvmCommand& cmd,
                 const std::string& config) const;

    const CommandCache&
    cache() const
    {
        return cache_;
    }

    const ModeCoordinator&
    coordinator() const
    {
        return coordinator_;
    }

    const ConcurrencyGate&
    gate() const
    {
        return gate_;
    }

private:
    DECLARE_LOGGER("CommandExecutor");

    DeviceView& view_;
    ProcessRunner& runner_;

    const std::string binary_;
    const uint32_t read_only_retries_;
    const boost::chrono::milliseconds retry_delay_;

    CommandCache cache_;
    ModeCoordinator coordinator_;
    ConcurrencyGate gate_;

    CommandResult
    run_once_(const LvmCommand& cmd,
              const CommandCache::Entry& entry);
};

}

#endif // !LVMCOORD_COMMAND_EXECUTOR_H_

// Local Variables: **
// mode: c++ **
// End: **

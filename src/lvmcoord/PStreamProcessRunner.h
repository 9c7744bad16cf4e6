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

#ifndef LVMCOORD_PSTREAM_PROCESS_RUNNER_H_
#define LVMCOORD_PSTREAM_PROCESS_RUNNER_H_

#include "ProcessRunner.h"

#include <youtils/BooleanEnum.h>
#include <youtils/Logging.h>

BOOLEAN_ENUM(UseSudo);

namespace lvmcoord
{

// Spawns the command via pstreams. Privileged commands are run through
// "sudo -n" unless sudo is disabled (e.g. when already running as root).
class PStreamProcessRunner
    : public ProcessRunner
{
public:
    PStreamProcessRunner(const UseSudo use_sudo,
                         const std::string& sudo_binary);

    ~PStreamProcessRunner() = default;

    PStreamProcessRunner(const PStreamProcessRunner&) = delete;

    PStreamProcessRunner&
    operator=(const PStreamProcessRunner&) = delete;

    CommandResult
    run(const std::vector<std::string>& args,
        const Privileged) override final;

    // The argument vector that is actually executed.
    std::vector<std::string>
    command_line(const std::vector<std::string>& args,
                 const Privileged) const;

private:
    DECLARE_LOGGER("PStreamProcessRunner");

    const UseSudo use_sudo_;
    const std::string sudo_binary_;
};

}

#endif // !LVMCOORD_PSTREAM_PROCESS_RUNNER_H_

// Local Variables: **
// mode: c++ **
// End: **

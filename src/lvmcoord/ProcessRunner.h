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

#ifndef LVMCOORD_PROCESS_RUNNER_H_
#define LVMCOORD_PROCESS_RUNNER_H_

#include <string>
#include <vector>

#include <youtils/BooleanEnum.h>
#include <youtils/System.h>

BOOLEAN_ENUM(Privileged);

namespace lvmcoord
{

// status, stdout and stderr of a finished process
using CommandResult = youtils::ExecResult;

// Runs a command to completion. A nonzero exit status is a regular result;
// youtils::ProcessException is thrown if the command could not be run at
// all.
class ProcessRunner
{
public:
    virtual ~ProcessRunner() = default;

    virtual CommandResult
    run(const std::vector<std::string>& args,
        const Privileged) = 0;
};

}

#endif // !LVMCOORD_PROCESS_RUNNER_H_

// Local Variables: **
// mode: c++ **
// End: **

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

#ifndef YT_SYSTEM_H_
#define YT_SYSTEM_H_

#include "IOException.h"
#include "Logging.h"

#include <string>
#include <vector>

namespace youtils
{

MAKE_EXCEPTION(ProcessException, fungi::IOException);

struct ExecResult
{
    int status;
    std::string out;
    std::string err;
};

struct System
{
    DECLARE_LOGGER("System");

    // Runs argv[0] (looked up in PATH) with the given arguments, without a
    // shell, and collects its output. A nonzero status is returned, not
    // thrown; ProcessException means the process could not be started.
    // The status of a process killed by a signal is 128 + signal number.
    static ExecResult
    exec(const std::vector<std::string>& argv);
};

}

#endif // !YT_SYSTEM_H_

// Local Variables: **
// mode: c++ **
// End: **

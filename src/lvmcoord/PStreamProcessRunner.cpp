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

#include "PStreamProcessRunner.h"

#include <youtils/Assert.h>

namespace lvmcoord
{

namespace yt = youtils;

PStreamProcessRunner::PStreamProcessRunner(const UseSudo use_sudo,
                                           const std::string& sudo_binary)
    : use_sudo_(use_sudo)
    , sudo_binary_(sudo_binary)
{
    if (T(use_sudo_))
    {
        VERIFY(not sudo_binary_.empty());
    }
}

std::vector<std::string>
PStreamProcessRunner::command_line(const std::vector<std::string>& args,
                                   const Privileged privileged) const
{
    std::vector<std::string> argv;

    if (T(privileged) and T(use_sudo_))
    {
        argv.reserve(args.size() + 2);
        argv.push_back(sudo_binary_);
        // never prompt for a password
        argv.push_back("-n");
    }

    argv.insert(argv.end(),
                args.begin(),
                args.end());

    return argv;
}

CommandResult
PStreamProcessRunner::run(const std::vector<std::string>& args,
                          const Privileged privileged)
{
    VERIFY(not args.empty());

    const std::vector<std::string> argv(command_line(args,
                                                     privileged));
    return yt::System::exec(argv);
}

}

// Local Variables: **
// mode: c++ **
// End: **

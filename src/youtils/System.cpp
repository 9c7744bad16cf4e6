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

#include "Assert.h"
#include "System.h"

#include <sys/wait.h>

#include <cstring>

#include <boost/chrono.hpp>
#include <boost/thread/thread.hpp>

#include <pstreams/pstream.h>

namespace youtils
{

namespace
{

// Appends what is available on the currently selected stream without
// blocking. Returns whether anything was read; eof is flagged on the stream.
bool
drain_available(std::istream& is,
                std::string& str)
{
    char buf[4096];
    bool progress = false;
    std::streamsize n;

    while ((n = is.readsome(buf, sizeof(buf))) > 0)
    {
        str.append(buf, n);
        progress = true;
    }

    return progress;
}

}

ExecResult
System::exec(const std::vector<std::string>& argv)
{
    VERIFY(not argv.empty());

    const redi::pstreams::pmode mode =
        redi::pstreams::pstdout bitor redi::pstreams::pstderr;

    redi::ipstream proc(argv.front(),
                        argv,
                        mode);

    if (not proc.is_open())
    {
        const int err = proc.rdbuf()->error();
        LOG_ERROR("Failed to start " << argv.front() << ": " << strerror(err));
        throw ProcessException("Failed to start process",
                               argv.front().c_str(),
                               err);
    }

    ExecResult res;

    // Both pipes are drained alternately: reading one of them to EOF first
    // deadlocks once the child fills the other one.
    bool out_done = false;
    bool err_done = false;

    while (not out_done or not err_done)
    {
        bool progress = false;

        if (not out_done)
        {
            progress = drain_available(proc.out(),
                                       res.out) or progress;
            if (proc.eof())
            {
                out_done = true;
                proc.clear();
            }
        }

        if (not err_done)
        {
            progress = drain_available(proc.err(),
                                       res.err) or progress;
            if (proc.eof())
            {
                err_done = true;
                proc.clear();
            }
        }

        if (not progress and not (out_done and err_done))
        {
            boost::this_thread::sleep_for(boost::chrono::milliseconds(1));
        }
    }

    proc.close();

    const int wstatus = proc.rdbuf()->status();
    if (WIFEXITED(wstatus))
    {
        res.status = WEXITSTATUS(wstatus);
    }
    else if (WIFSIGNALED(wstatus))
    {
        res.status = 128 + WTERMSIG(wstatus);
        LOG_WARN(argv.front() << " was killed by signal " << WTERMSIG(wstatus));
    }
    else
    {
        LOG_ERROR(argv.front() << ": unexpected wait status " << wstatus);
        throw ProcessException("Unexpected wait status",
                               argv.front().c_str());
    }

    return res;
}

}

// Local Variables: **
// mode: c++ **
// End: **

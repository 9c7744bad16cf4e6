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

#include "TestMainHelper.h"

#include <signal.h>

#include <cstring>

#include <gtest/gtest.h>

namespace youtils
{

void
TestMainHelper::sighand(int)
{}

TestMainHelper::TestMainHelper(int argc,
                               char** argv)
    : MainHelper(argc,
                 argv)
{
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SIG_IGN;
    sa.sa_flags = 0;
    sigaction(SIGPIPE, &sa, 0);
    sa.sa_handler = &sighand;
    sa.sa_flags = 0;
    sigaction(SIGUSR1, &sa, 0);
}

void
TestMainHelper::log_google_test_help(std::ostream& ostr)
{
    // gtest prints its help on std::cout
    ArgcArgv args(executable_name_,
                  { "--help" });

    std::streambuf* old_rdbuf = std::cout.rdbuf();
    try
    {
        std::cout.rdbuf(ostr.rdbuf());
        testing::InitGoogleTest(args.argc(),
                                args.argv());
    }
    catch (...)
    {
        std::cout.rdbuf(old_rdbuf);
        throw;
    }
    std::cout.rdbuf(old_rdbuf);
}

void
TestMainHelper::init_google_test()
{
    ArgcArgv args(executable_name_,
                  unparsed_options());

    testing::InitGoogleTest(args.argc(),
                            args.argv());
    unparsed_options(*args.argc(),
                     args.argv());
}

int
TestMainHelper::run()
{
    return RUN_ALL_TESTS();
}

}

// Local Variables: **
// mode: c++ **
// End: **

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

#include "../System.h"
#include "../TestBase.h"

namespace youtilstest
{

using namespace youtils;

class SystemTest
    : public TestBase
{};

TEST_F(SystemTest, exec)
{
    const ExecResult res(System::exec({ "/bin/sh",
                                        "-c",
                                        "echo foo; echo bar >&2; exit 3" }));
    EXPECT_EQ(3, res.status);
    EXPECT_EQ("foo\n", res.out);
    EXPECT_EQ("bar\n", res.err);
}

TEST_F(SystemTest, exec_no_output)
{
    const ExecResult res(System::exec({ "/bin/true" }));
    EXPECT_EQ(0, res.status);
    EXPECT_TRUE(res.out.empty());
    EXPECT_TRUE(res.err.empty());
}

TEST_F(SystemTest, exec_large_output)
{
    const ExecResult res(System::exec({ "/bin/sh",
                                        "-c",
                                        "i=0; while [ $i -lt 20000 ]; do echo 0123456789; i=$((i+1)); done" }));
    EXPECT_EQ(0, res.status);
    EXPECT_EQ(20000U * 11U, res.out.size());
}

TEST_F(SystemTest, exec_large_error_output)
{
    const ExecResult res(System::exec({ "/bin/sh",
                                        "-c",
                                        "head -c 200000 /dev/zero >&2; echo ok" }));
    EXPECT_EQ(0, res.status);
    EXPECT_EQ("ok\n", res.out);
    EXPECT_EQ(200000U, res.err.size());
}

TEST_F(SystemTest, exec_interleaved_output)
{
    const ExecResult res(System::exec({ "/bin/sh",
                                        "-c",
                                        "i=0; while [ $i -lt 5000 ]; do echo out; echo err >&2; i=$((i+1)); done" }));
    EXPECT_EQ(0, res.status);
    EXPECT_EQ(5000U * 4U, res.out.size());
    EXPECT_EQ(5000U * 4U, res.err.size());
}

TEST_F(SystemTest, exec_in_scratch_directory)
{
    const boost::filesystem::path p(directory() / "touched");

    const ExecResult res(System::exec({ "/usr/bin/touch",
                                        p.string() }));
    EXPECT_EQ(0, res.status);
    EXPECT_TRUE(boost::filesystem::exists(p));
}

TEST_F(SystemTest, exec_killed)
{
    const ExecResult res(System::exec({ "/bin/sh",
                                        "-c",
                                        "kill -9 $$" }));
    EXPECT_EQ(128 + 9, res.status);
}

TEST_F(SystemTest, exec_failure)
{
    EXPECT_THROW(System::exec({ "/this/does/not/exist" }),
                 ProcessException);
}

}

// Local Variables: **
// mode: c++ **
// End: **

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

#include <gtest/gtest.h>

#include "../IOException.h"
#include "../ScopeExit.h"

namespace youtilstest
{

using namespace youtils;

class ScopeExitTest
    : public testing::Test
{
public:
    MAKE_EXCEPTION(ScopeExitTestException, fungi::IOException);
};

TEST_F(ScopeExitTest, on_exception)
{
    bool done = false;

    EXPECT_THROW({
            auto on_exit = make_scope_exit([&]
                                           {
                                               done = true;
                                           });
            ASSERT_FALSE(done);

            throw ScopeExitTestException("blah");
        },
        ScopeExitTestException);

    EXPECT_TRUE(done);
}

TEST_F(ScopeExitTest, on_leaving_scope)
{
    bool done = false;

    {
        auto on_exit = make_scope_exit([&]
                                       {
                                           done = true;
                                       });
        EXPECT_FALSE(done);
    }

    EXPECT_TRUE(done);
}

TEST_F(ScopeExitTest, dismissed)
{
    bool done = false;

    {
        auto on_exit = make_scope_exit([&]
                                       {
                                           done = true;
                                       });
        on_exit.dismiss();
    }

    EXPECT_FALSE(done);
}

TEST_F(ScopeExitTest, moved)
{
    unsigned count = 0;

    {
        auto on_exit = make_scope_exit([&]
                                       {
                                           ++count;
                                       });
        auto other(std::move(on_exit));
    }

    EXPECT_EQ(1U, count);
}

}

// Local Variables: **
// mode: c++ **
// End: **
